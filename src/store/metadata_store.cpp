#include "store/metadata_store.hpp"
#include <boost/log/trivial.hpp>
#include <json/reader.h>
#include <json/writer.h>
#include <fstream>
#include <memory>

namespace chunknode {
namespace store {

namespace {

const char* const TEMP_SUFFIX = ".tmp";

[[noreturn]] void malformed(const std::string& what) {
  throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Metadata store: Malformed metadata: " + what);
}

} // namespace

//==============================================
// JSON CONVERSION
//==============================================

Json::Value NodeMetadata::to_json() const {
  Json::Value root(Json::objectValue);
  root["node_id"] = node_id;

  Json::Value chunk_map(Json::objectValue);
  for (const auto& [chunk_id, record] : chunks) {
    Json::Value entry(Json::objectValue);
    entry["file_id"] = record.file_id;
    entry["size"] = static_cast<Json::Int64>(record.size);
    entry["created"] = record.created;
    entry["checksum"] = record.checksum;
    chunk_map[chunk_id] = entry;
  }
  root["chunks"] = chunk_map;
  root["total_stored"] = static_cast<Json::Int64>(total_stored);
  return root;
}

NodeMetadata NodeMetadata::from_json(const Json::Value& value) {
  if (!value.isObject()) {
    malformed("root is not an object");
  }
  if (!value["node_id"].isString()) {
    malformed("node_id missing");
  }

  NodeMetadata metadata;
  metadata.node_id = value["node_id"].asString();

  const Json::Value& chunk_map = value["chunks"];
  if (!chunk_map.isNull() && !chunk_map.isObject()) {
    malformed("chunks is not an object");
  }

  for (const auto& chunk_id : chunk_map.getMemberNames()) {
    const Json::Value& entry = chunk_map[chunk_id];
    if (!entry.isObject() || !entry["size"].isIntegral() || !entry["checksum"].isString()) {
      malformed("record for chunk " + chunk_id);
    }

    ChunkRecord record;
    record.chunk_id = chunk_id;
    // Older writers stored a null file_id when the uploader omitted it
    record.file_id = entry["file_id"].isString() ? entry["file_id"].asString() : std::string();
    record.size = entry["size"].asInt64();
    record.created = entry["created"].isNumeric() ? entry["created"].asDouble() : 0.0;
    record.checksum = entry["checksum"].asString();
    metadata.chunks.emplace(chunk_id, std::move(record));
  }

  if (value["total_stored"].isNumeric()) {
    metadata.total_stored = value["total_stored"].asInt64();
  }
  return metadata;
}


//==============================================
// CONSTRUCTOR
//==============================================

MetadataStore::MetadataStore(const std::filesystem::path& metadata_file, const std::string& default_node_id)
  : path_(metadata_file)
  , default_node_id_(default_node_id) {
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Using metadata file " << path_.string();
}


//==============================================
// PERSISTENCE
//==============================================

NodeMetadata MetadataStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  bool present = std::filesystem::exists(path_, ec);
  if (ec) {
    // Unknown state must not be mistaken for a missing file
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Cannot access " << path_.string() << ": " << ec.message();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                     "Metadata store: Cannot access " + path_.string() + ": " + ec.message());
  }

  if (present) {
    metadata_ = read_file();
    BOOST_LOG_TRIVIAL(info) << "Metadata store: Loaded metadata for node " << metadata_.node_id
                            << " with " << metadata_.chunks.size() << " chunk records";
    return metadata_;
  }

  BOOST_LOG_TRIVIAL(info) << "Metadata store: No metadata file, initializing for node " << default_node_id_;

  NodeMetadata fresh;
  fresh.node_id = default_node_id_;
  fresh.total_stored = 0;
  write_file(fresh);
  metadata_ = fresh;
  return metadata_;
}

void MetadataStore::save(const NodeMetadata& metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  write_file(metadata);
  metadata_ = metadata;
}

NodeMetadata MetadataStore::read_file() const {
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                     "Metadata store: Failed to open " + path_.string());
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors)) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Failed to parse " << path_.string() << ": " << errors;
    throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                     "Metadata store: Failed to parse metadata: " + errors);
  }

  return NodeMetadata::from_json(root);
}

void MetadataStore::write_file(const NodeMetadata& metadata) const {
  std::filesystem::path temp_path = path_;
  temp_path += TEMP_SUFFIX;

  try {
    if (path_.has_parent_path()) {
      std::filesystem::create_directories(path_.parent_path());
    }

    {
      std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                         "Metadata store: Failed to create " + temp_path.string());
      }

      Json::StreamWriterBuilder builder;
      builder["indentation"] = "  ";
      std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
      writer->write(metadata.to_json(), &file);
      file << '\n';
      file.flush();

      if (!file.good()) {
        throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                         "Metadata store: Failed to write " + temp_path.string());
      }
    }

    // Readers see either the previous file or the complete new one
    std::filesystem::rename(temp_path, path_);
    BOOST_LOG_TRIVIAL(debug) << "Metadata store: Persisted " << metadata.chunks.size() << " chunk records";
  }
  catch (const std::filesystem::filesystem_error& e) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Failed to persist metadata: " << e.what();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                     std::string("Metadata store: Failed to persist metadata: ") + e.what());
  }
  catch (const StoreError&) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    throw;
  }
}


//==============================================
// RECORD OPERATIONS
//==============================================

void MetadataStore::put_record(const ChunkRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  NodeMetadata updated = metadata_;
  updated.chunks[record.chunk_id] = record;

  updated.total_stored = 0;
  for (const auto& [chunk_id, entry] : updated.chunks) {
    updated.total_stored += entry.size;
  }

  // Memory only changes once the file does
  write_file(updated);
  metadata_ = std::move(updated);
}

std::optional<ChunkRecord> MetadataStore::find_record(const std::string& chunk_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = metadata_.chunks.find(chunk_id);
  if (it == metadata_.chunks.end()) {
    return std::nullopt;
  }
  return it->second;
}


//==============================================
// QUERY OPERATIONS
//==============================================

NodeMetadata MetadataStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metadata_;
}

std::string MetadataStore::node_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metadata_.node_id.empty() ? default_node_id_ : metadata_.node_id;
}

} // namespace store
} // namespace chunknode
