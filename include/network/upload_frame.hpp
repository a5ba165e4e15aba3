#ifndef CHUNKNODE_NETWORK_UPLOAD_FRAME_HPP
#define CHUNKNODE_NETWORK_UPLOAD_FRAME_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunknode {
namespace network {

// Header declaring the byte length of the JSON block that opens an upload body
inline constexpr const char* METADATA_LENGTH_HEADER = "X-Metadata-Length";

// Upload body layout: [JSON metadata block][raw chunk payload]
struct UploadFrame {
    std::string chunk_id;
    std::string file_id;
    // Optional, informational only
    std::string filename;
    std::string payload;
};

class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& message)
        : std::runtime_error(message) {}
};

class UploadCodec {
public:
    // ---- SERIALIZATION AND DESERIALIZATION ----
    // Writes the framed body and returns the metadata length for the header
    std::size_t serialize(const UploadFrame& frame, std::string& body) const;
    // Splits a framed body; throws FrameError on a malformed header or block
    UploadFrame deserialize(const std::string& metadata_length, const std::string& body) const;

private:
    // ---- UTILITY METHODS ----
    static std::size_t parse_length(const std::string& metadata_length);
};

} // namespace network
} // namespace chunknode

#endif // CHUNKNODE_NETWORK_UPLOAD_FRAME_HPP
