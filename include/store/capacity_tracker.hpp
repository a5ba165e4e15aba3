#pragma once

#include <cstdint>
#include <filesystem>
#include <json/value.h>

namespace chunknode {
namespace store {

// Suffix of every persisted chunk file
inline constexpr const char* CHUNK_SUFFIX = ".chunk";

struct StorageStats {
  std::int64_t used_bytes{0};
  std::int64_t allocated_bytes{0};
  // Negative when the node holds more than its allocation
  std::int64_t free_bytes{0};
  std::uint64_t chunk_count{0};
  double usage_percent{0.0};

  Json::Value to_json() const;
};

class CapacityTracker {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CapacityTracker(const std::filesystem::path& chunks_dir, std::int64_t allocated_bytes);


  // ---- QUERY OPERATIONS ----
  // Scans the chunk directory; usage is always recomputed from disk
  StorageStats stats() const;

  std::int64_t allocated_bytes() const { return allocated_bytes_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path chunks_dir_;
  std::int64_t allocated_bytes_;
};

} // namespace store
} // namespace chunknode
