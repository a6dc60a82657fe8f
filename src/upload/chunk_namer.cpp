#include "chunkstore/upload/chunk_namer.h"

#include <cctype>
#include <stdexcept>

namespace chunkstore::upload {

std::string ChunkName(const std::string& destination, int index) {
    if (index < 1) {
        throw std::invalid_argument("chunk index must be >= 1, got " + std::to_string(index));
    }
    if (index == 1) {
        return destination;
    }
    return destination + kChunkNamePart + std::to_string(index);
}

bool IsChunkPartName(const std::string& destination, const std::string& name) {
    const std::string prefix = destination + kChunkNamePart;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    const auto index = name.substr(prefix.size());
    if (index.front() == '0') {
        return false;
    }
    for (char c : index) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return index != "1";
}

}  // namespace chunkstore::upload
