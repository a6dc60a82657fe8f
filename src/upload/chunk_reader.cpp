#include "chunkstore/upload/chunk_reader.h"

#include <exception>
#include <ios>
#include <string>

namespace chunkstore::upload {

namespace {

core::Error ReadFailure(const std::string& detail) {
    return core::Error{core::ErrorCode::kIoError, "stream read failed: " + detail};
}

}  // namespace

core::Result<std::size_t> ReadChunk(std::istream& input, char* buffer, std::size_t capacity) {
    std::size_t offset = 0;
    try {
        // A single read may come back short without the stream being exhausted.
        while (offset < capacity && input.good()) {
            input.read(buffer + offset, static_cast<std::streamsize>(capacity - offset));
            const std::streamsize bytes = input.gcount();
            if (bytes > 0) {
                offset += static_cast<std::size_t>(bytes);
            }
            if (input.bad()) {
                return ReadFailure("stream entered a bad state after " +
                                   std::to_string(offset) + " bytes");
            }
            if (input.eof()) {
                break;
            }
        }
    } catch (const std::ios_base::failure& ex) {
        // Streams with exceptions(failbit | eofbit) throw on a plain end-of-stream.
        if (input.eof() && !input.bad()) {
            return offset + static_cast<std::size_t>(input.gcount());
        }
        return ReadFailure(ex.what());
    } catch (const std::exception& ex) {
        return ReadFailure(ex.what());
    }
    if (input.bad()) {
        return ReadFailure("stream is in a bad state");
    }
    return offset;
}

core::Result<bool> HasRemaining(std::istream& input) {
    try {
        if (!input.good()) {
            if (input.bad()) {
                return ReadFailure("stream is in a bad state");
            }
            return false;
        }
        const auto next = input.peek();
        if (input.bad()) {
            return ReadFailure("stream entered a bad state while peeking");
        }
        return next != std::istream::traits_type::eof();
    } catch (const std::ios_base::failure& ex) {
        if (input.eof() && !input.bad()) {
            return false;
        }
        return ReadFailure(ex.what());
    } catch (const std::exception& ex) {
        return ReadFailure(ex.what());
    }
}

}  // namespace chunkstore::upload
