#include "chunkstore/storage/local_object_store.h"

#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/UUIDGenerator.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chunkstore::storage {

namespace {
constexpr std::size_t kCopyBufferSize = 8192;
}  // namespace

/// Temp file that is removed on destruction unless it was renamed into place.
class LocalObjectStore::TempObject {
public:
    explicit TempObject(const std::string& temp_dir)
        : path_((std::filesystem::path(temp_dir) /
                 Poco::UUIDGenerator().createOne().toString())
                    .string()) {}

    ~TempObject() {
        Close();
        if (!committed_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    TempObject(const TempObject&) = delete;
    TempObject& operator=(const TempObject&) = delete;

    bool Open() {
#ifdef _WIN32
        out_.open(path_, std::ios::binary | std::ios::trunc);
        return out_.is_open();
#else
        fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
        return fd_ >= 0;
#endif
    }

    bool Write(const char* data, std::size_t size) {
#ifdef _WIN32
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_) {
            return false;
        }
#else
        std::size_t written_total = 0;
        while (written_total < size) {
            const ssize_t written =
                ::write(fd_, data + written_total, size - written_total);
            if (written < 0) {
                return false;
            }
            written_total += static_cast<std::size_t>(written);
        }
#endif
        if (size > 0) {
            sha256_.update(data, static_cast<unsigned int>(size));
        }
        total_ += static_cast<std::uint64_t>(size);
        return true;
    }

    bool Finish() {
#ifdef _WIN32
        out_.flush();
        const bool ok = static_cast<bool>(out_);
        out_.close();
        return ok;
#else
        const bool ok = ::fsync(fd_) == 0;
        Close();
        return ok;
#endif
    }

    void MarkCommitted() { committed_ = true; }

    const std::string& path() const { return path_; }
    std::uint64_t total() const { return total_; }
    std::string Etag() { return Poco::DigestEngine::digestToHex(sha256_.digest()); }

private:
    void Close() {
#ifdef _WIN32
        if (out_.is_open()) {
            out_.close();
        }
#else
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
#endif
    }

    std::string path_;
    Poco::SHA2Engine256 sha256_;
    std::uint64_t total_{0};
    bool committed_{false};
#ifdef _WIN32
    std::ofstream out_;
#else
    int fd_{-1};
#endif
};

LocalObjectStore::LocalObjectStore(std::string base_path, std::string temp_path)
    : base_path_(std::move(base_path)), temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(base_path_);
    std::filesystem::create_directories(temp_path_);
}

core::Result<StoredObject> LocalObjectStore::Create(const std::string& bucket,
                                                    const std::string& key, const char* data,
                                                    std::size_t offset, std::size_t length,
                                                    const CreateOptions& /*options*/) {
    // Objects are stored as raw bytes; there is no transport encoding to disable.
    if (!IsSafeName(bucket) || !IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object path"};
    }
    if (data == nullptr && length > 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "missing object data"};
    }

    TempObject temp(temp_path_);
    if (!temp.Open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    if (length > 0 && !temp.Write(data + offset, length)) {
        return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
    }
    return Commit(temp, bucket, key);
}

core::Result<StoredObject> LocalObjectStore::CreateFromStream(const std::string& bucket,
                                                              const std::string& key,
                                                              std::istream& data) {
    if (!IsSafeName(bucket) || !IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object path"};
    }

    TempObject temp(temp_path_);
    if (!temp.Open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    std::array<char, kCopyBufferSize> buffer{};
    while (data) {
        data.read(buffer.data(), buffer.size());
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        if (!temp.Write(buffer.data(), static_cast<std::size_t>(bytes))) {
            return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
        }
    }
    if (data.bad()) {
        return core::Error{core::ErrorCode::kIoError, "failed to read object stream"};
    }
    return Commit(temp, bucket, key);
}

core::Result<StoredObject> LocalObjectStore::Compose(const std::string& bucket,
                                                     const std::vector<std::string>& sources,
                                                     const std::string& destination) {
    if (!IsSafeName(bucket) || !IsSafeKey(destination)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object path"};
    }
    if (sources.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "compose requires a source"};
    }
    if (sources.size() > static_cast<std::size_t>(kComposeRequestLimit)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "compose accepts at most " + std::to_string(kComposeRequestLimit) +
                               " sources, got " + std::to_string(sources.size())};
    }

    TempObject temp(temp_path_);
    if (!temp.Open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
    std::array<char, kCopyBufferSize> buffer{};
    for (const auto& source : sources) {
        if (!IsSafeKey(source)) {
            return core::Error{core::ErrorCode::kInvalidArgument, "invalid source path"};
        }
        std::ifstream in(BuildObjectPath(base_path_, bucket, source), std::ios::binary);
        if (!in.is_open()) {
            return core::Error{core::ErrorCode::kNotFound, "source not found: " + source};
        }
        while (in) {
            in.read(buffer.data(), buffer.size());
            const std::streamsize bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            if (!temp.Write(buffer.data(), static_cast<std::size_t>(bytes))) {
                return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
            }
        }
        if (in.bad()) {
            return core::Error{core::ErrorCode::kIoError, "failed to read source: " + source};
        }
    }
    // The destination is usually also the first source; it is only replaced once every
    // source has been copied.
    return Commit(temp, bucket, destination);
}

core::Result<void> LocalObjectStore::Delete(const std::string& bucket, const std::string& key) {
    if (!IsSafeName(bucket) || !IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object path"};
    }
    const std::filesystem::path path = BuildObjectPath(base_path_, bucket, key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to delete object: " + ec.message()};
    }

    // Prune directories left empty by nested keys, stopping at the bucket's object root.
    const auto objects_root =
        std::filesystem::path(base_path_) / "buckets" / bucket / "objects";
    for (auto dir = path.parent_path(); dir != objects_root && dir.has_relative_path();
         dir = dir.parent_path()) {
        if (!std::filesystem::is_empty(dir, ec) || ec) {
            break;
        }
        std::filesystem::remove(dir, ec);
        if (ec) {
            break;
        }
    }
    return core::Ok();
}

core::Result<StoredObject> LocalObjectStore::Stat(const std::string& bucket,
                                                  const std::string& key) const {
    if (!IsSafeName(bucket) || !IsSafeKey(key)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object path"};
    }
    const auto path = BuildObjectPath(base_path_, bucket, key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "object not found"};
    }
    StoredObject stored;
    stored.bucket = bucket;
    stored.name = key;
    stored.path = path;
    stored.size_bytes = static_cast<std::uint64_t>(std::filesystem::file_size(path, ec));
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to stat object: " + ec.message()};
    }
    return stored;
}

core::Result<StoredObject> LocalObjectStore::Commit(TempObject& temp, const std::string& bucket,
                                                    const std::string& key) {
    if (!temp.Finish()) {
        return core::Error{core::ErrorCode::kIoError, "failed to flush temp file"};
    }

    const auto final_path = BuildObjectPath(base_path_, bucket, key);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(final_path).parent_path(), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to create object directory: " + ec.message()};
    }
    std::filesystem::rename(temp.path(), final_path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to commit object: " + ec.message()};
    }
    temp.MarkCommitted();

    StoredObject stored;
    stored.bucket = bucket;
    stored.name = key;
    stored.path = final_path;
    stored.size_bytes = temp.total();
    stored.etag = temp.Etag();
    return stored;
}

bool LocalObjectStore::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

bool LocalObjectStore::IsSafeKey(const std::string& key) {
    if (key.empty() || key.size() > 1024) {
        return false;
    }
    std::stringstream ss(key);
    std::string segment;
    std::size_t segments = 0;
    while (std::getline(ss, segment, '/')) {
        if (!IsSafeName(segment)) {
            return false;
        }
        ++segments;
    }
    // getline drops a trailing empty segment, so reject "a/" explicitly.
    return segments > 0 && key.back() != '/';
}

std::string LocalObjectStore::BuildObjectPath(const std::string& base_path,
                                              const std::string& bucket,
                                              const std::string& key) {
    return (std::filesystem::path(base_path) / "buckets" / bucket / "objects" / key).string();
}

}  // namespace chunkstore::storage
