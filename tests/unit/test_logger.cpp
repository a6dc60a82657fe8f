#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/AutoPtr.h>
#include <Poco/Channel.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>

#include "chunkstore/core/logger.h"

namespace {

class CapturingChannel : public Poco::Channel {
public:
    void log(const Poco::Message& msg) override { messages.push_back(msg.getText()); }

    std::vector<std::string> messages;
};

Poco::Logger& Logger() { return Poco::Logger::get("chunkstore"); }

}  // namespace

TEST(Logger, MapsNamedLevels) {
    chunkstore::core::InitLogging("warning");
    EXPECT_EQ(Logger().getLevel(), Poco::Message::PRIO_WARNING);

    chunkstore::core::InitLogging("debug");
    EXPECT_EQ(Logger().getLevel(), Poco::Message::PRIO_DEBUG);
}

TEST(Logger, UnknownLevelFallsBackToInformation) {
    chunkstore::core::InitLogging("chatty");
    EXPECT_EQ(Logger().getLevel(), Poco::Message::PRIO_INFORMATION);
}

TEST(Logger, UploadLineIsValidJson) {
    chunkstore::core::InitLogging("information");
    Poco::AutoPtr<CapturingChannel> channel(new CapturingChannel());
    Logger().setChannel(channel);

    chunkstore::core::LogUpload("bucket", "dir/\"quoted\".bytes", 3, true, "ok", 42);

    ASSERT_EQ(channel->messages.size(), 1u);
    Poco::JSON::Parser parser;
    auto line = parser.parse(channel->messages[0]).extract<Poco::JSON::Object::Ptr>();
    EXPECT_EQ(line->getValue<std::string>("event"), "upload");
    EXPECT_EQ(line->getValue<std::string>("destination"), "dir/\"quoted\".bytes");
    EXPECT_EQ(line->getValue<int>("parts"), 3);
    EXPECT_TRUE(line->getValue<bool>("composed"));
    EXPECT_EQ(line->getValue<std::string>("status"), "ok");

    chunkstore::core::InitLogging("information");
}
