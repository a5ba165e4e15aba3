#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <json/value.h>
#include "store/store_error.hpp"

namespace chunknode {
namespace store {

struct ChunkRecord {
  std::string chunk_id;
  std::string file_id;
  std::int64_t size{0};
  // Seconds since the Unix epoch
  double created{0.0};
  // Lowercase hex SHA-256 of the payload
  std::string checksum;
};

struct NodeMetadata {
  std::string node_id;
  std::map<std::string, ChunkRecord> chunks;
  // Informational only, usage is recomputed from disk
  std::int64_t total_stored{0};

  Json::Value to_json() const;
  // Throws StoreError(STORAGE_FAILURE) if the document is malformed
  static NodeMetadata from_json(const Json::Value& value);
};

class MetadataStore {
public:
  // Delete copy constructor and assignment operator
  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // default_node_id seeds a fresh metadata file; an existing file keeps its own id
  MetadataStore(const std::filesystem::path& metadata_file, const std::string& default_node_id);


  // ---- PERSISTENCE ----
  // Reads the metadata file, creating it first if missing
  NodeMetadata load();
  // Atomically replaces the metadata file with the given structure
  void save(const NodeMetadata& metadata);


  // ---- RECORD OPERATIONS ----
  // Inserts or replaces one record and persists the whole structure.
  // Serialized against every other mutation.
  void put_record(const ChunkRecord& record);
  std::optional<ChunkRecord> find_record(const std::string& chunk_id) const;


  // ---- QUERY OPERATIONS ----
  NodeMetadata snapshot() const;
  std::string node_id() const;
  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::string default_node_id_;

  // In-memory copy of the persisted structure and its access mutex
  mutable std::mutex mutex_;
  NodeMetadata metadata_;


  // ---- PERSISTENCE ----
  NodeMetadata read_file() const;
  // Writes to a temp file beside path_ then renames over it
  void write_file(const NodeMetadata& metadata) const;
};

} // namespace store
} // namespace chunknode
