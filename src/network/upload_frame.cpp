#include "network/upload_frame.hpp"
#include <boost/log/trivial.hpp>
#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>
#include <limits>
#include <memory>

namespace chunknode {
namespace network {

std::size_t UploadCodec::serialize(const UploadFrame& frame, std::string& body) const {
  Json::Value metadata(Json::objectValue);
  metadata["chunk_id"] = frame.chunk_id;
  metadata["file_id"] = frame.file_id;
  if (!frame.filename.empty()) {
    metadata["filename"] = frame.filename;
  }
  metadata["chunk_size"] = static_cast<Json::UInt64>(frame.payload.size());

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  std::string block = Json::writeString(builder, metadata);

  body.clear();
  body.reserve(block.size() + frame.payload.size());
  body.append(block);
  body.append(frame.payload);

  BOOST_LOG_TRIVIAL(debug) << "Upload codec: Serialized chunk " << frame.chunk_id << " with "
                           << block.size() << " metadata bytes and " << frame.payload.size() << " payload bytes";
  return block.size();
}

UploadFrame UploadCodec::deserialize(const std::string& metadata_length, const std::string& body) const {
  std::size_t length = parse_length(metadata_length);
  if (length > body.size()) {
    BOOST_LOG_TRIVIAL(error) << "Upload codec: Metadata length " << length
                             << " exceeds body size " << body.size();
    throw FrameError("Metadata length exceeds request body");
  }

  // Parse the JSON block at the head of the body
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value metadata;
  std::string errors;
  const char* begin = body.data();
  if (!reader->parse(begin, begin + length, &metadata, &errors)) {
    BOOST_LOG_TRIVIAL(error) << "Upload codec: Invalid metadata block: " << errors;
    throw FrameError("Invalid metadata JSON");
  }

  if (!metadata.isObject()) {
    throw FrameError("Metadata must be a JSON object");
  }
  if (!metadata["chunk_id"].isString()) {
    throw FrameError("Metadata missing chunk_id");
  }
  if (!metadata["file_id"].isString()) {
    throw FrameError("Metadata missing file_id");
  }

  UploadFrame frame;
  frame.chunk_id = metadata["chunk_id"].asString();
  frame.file_id = metadata["file_id"].asString();
  if (metadata["filename"].isString()) {
    frame.filename = metadata["filename"].asString();
  }
  frame.payload = body.substr(length);

  // chunk_size is advisory, the payload length is what gets stored
  if (metadata["chunk_size"].isIntegral() &&
      metadata["chunk_size"].asUInt64() != static_cast<Json::UInt64>(frame.payload.size())) {
    BOOST_LOG_TRIVIAL(warning) << "Upload codec: Declared chunk_size " << metadata["chunk_size"].asUInt64()
                               << " differs from payload size " << frame.payload.size()
                               << " for chunk " << frame.chunk_id;
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload codec: Deserialized chunk " << frame.chunk_id
                           << " with " << frame.payload.size() << " payload bytes";
  return frame;
}

std::size_t UploadCodec::parse_length(const std::string& metadata_length) {
  if (metadata_length.empty()) {
    throw FrameError(std::string("Missing ") + METADATA_LENGTH_HEADER + " header");
  }

  std::size_t length = 0;
  for (char c : metadata_length) {
    if (c < '0' || c > '9') {
      throw FrameError(std::string("Invalid ") + METADATA_LENGTH_HEADER + " header");
    }
    std::size_t digit = static_cast<std::size_t>(c - '0');
    if (length > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
      throw FrameError(std::string("Invalid ") + METADATA_LENGTH_HEADER + " header");
    }
    length = length * 10 + digit;
  }
  return length;
}

} // namespace network
} // namespace chunknode
