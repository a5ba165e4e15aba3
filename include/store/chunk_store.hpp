#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include "store/capacity_tracker.hpp"
#include "store/metadata_store.hpp"
#include "store/store_error.hpp"

namespace chunknode {
namespace store {

// Result of the startup consistency check between metadata and chunk files
struct AuditReport {
  std::size_t records{0};
  std::size_t missing_files{0};
  std::size_t size_mismatches{0};
  std::size_t untracked_files{0};
  // Leftover temp files from interrupted writes, removed by the audit
  std::size_t stale_temp_files{0};

  bool clean() const { return missing_files == 0 && size_mismatches == 0 && untracked_files == 0; }
};

class ChunkStore {
public:
  // Delete copy constructor and assignment operator
  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates <storage_path>/chunks and loads <storage_path>/node_metadata.json.
  // With strict_verification a chunk file without a metadata record reads as corrupted.
  ChunkStore(const std::filesystem::path& storage_path, std::int64_t allocated_bytes,
             const std::string& node_id, bool strict_verification = false);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores payload under chunk_id and returns the number of bytes stored.
  // The capacity check is a soft limit: concurrent stores may overshoot the allocation.
  // The file write and its metadata record are one critical section.
  std::int64_t store(const std::string& chunk_id, const std::string& payload, const std::string& file_id);
  // Returns the payload after checking it against the recorded checksum
  std::string retrieve(const std::string& chunk_id) const;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& chunk_id) const;
  StorageStats stats() const;
  // Compares metadata records with the chunk directory. Only stale temp
  // files are removed; records and chunk files are left untouched.
  AuditReport audit() const;
  std::string node_id() const;

  const std::filesystem::path& chunks_dir() const { return chunks_dir_; }
  const CapacityTracker& capacity() const { return capacity_; }
  MetadataStore& metadata() { return metadata_; }


  // ---- UTILITY METHODS ----
  // Lowercase hex SHA-256 digest via OpenSSL EVP
  static std::string compute_checksum(const std::string& data);
  // Ids double as file names, so separators, dot names and NUL are refused
  static bool is_valid_chunk_id(const std::string& chunk_id);

private:
  // ---- PARAMETERS ----
  std::filesystem::path storage_path_;
  std::filesystem::path chunks_dir_;
  bool strict_verification_;

  // Storage components
  CapacityTracker capacity_;
  MetadataStore metadata_;

  // Held from the chunk file write until its record is persisted
  mutable std::mutex write_mutex_;


  // ---- PATH RESOLUTION ----
  std::filesystem::path chunk_path(const std::string& chunk_id) const;
  void validate_chunk_id(const std::string& chunk_id) const;


  // ---- FILE OPERATIONS ----
  // Writes payload to a temp file and renames it into place
  void write_chunk_file(const std::filesystem::path& file_path, const std::string& payload) const;
  std::string read_chunk_file(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace chunknode
