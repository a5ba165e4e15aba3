#ifndef CHUNKNODE_STORE_ERROR_HPP
#define CHUNKNODE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunknode {
namespace store {

enum class StoreErrorCode {
    INSUFFICIENT_SPACE,
    CHUNK_NOT_FOUND,
    CHUNK_CORRUPTED,
    STORAGE_FAILURE,
    INVALID_CHUNK_ID
};

inline const char* store_error_to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::INSUFFICIENT_SPACE: return "Insufficient space";
        case StoreErrorCode::CHUNK_NOT_FOUND: return "Chunk not found";
        case StoreErrorCode::CHUNK_CORRUPTED: return "Chunk corrupted";
        case StoreErrorCode::STORAGE_FAILURE: return "Storage failure";
        case StoreErrorCode::INVALID_CHUNK_ID: return "Invalid chunk id";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    StoreErrorCode code() const { return code_; }

private:
    StoreErrorCode code_;
};

} // namespace store
} // namespace chunknode

#endif // CHUNKNODE_STORE_ERROR_HPP
