#include "chunkstore/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace chunkstore::core {

namespace {
Poco::Logger& UploadLogger() {
    return Poco::Logger::get("chunkstore");
}
}  // namespace

void InitLogging(const std::string& level) {
    int priority = Poco::Message::PRIO_INFORMATION;
    bool known_level = true;
    try {
        priority = Poco::Logger::parseLevel(level);
    } catch (const Poco::InvalidArgumentException&) {
        known_level = false;
    }

    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    UploadLogger().setChannel(channel);
    UploadLogger().setLevel(priority);
    if (!known_level) {
        UploadLogger().warning("Unknown log level '" + level + "', using information");
    }
}

void LogInfo(const std::string& message) { UploadLogger().information(message); }
void LogError(const std::string& message) { UploadLogger().error(message); }
void LogDebug(const std::string& message) { UploadLogger().debug(message); }

void LogUpload(const std::string& bucket,
               const std::string& destination,
               std::size_t parts,
               bool composed,
               const std::string& status,
               long long latency_ms) {
    Poco::JSON::Object line;
    line.set("event", "upload");
    line.set("bucket", bucket);
    line.set("destination", destination);
    line.set("parts", static_cast<Poco::UInt64>(parts));
    line.set("composed", composed);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    std::ostringstream out;
    line.stringify(out);
    LogInfo(out.str());
}

}  // namespace chunkstore::core
