#include "store/capacity_tracker.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace chunknode {
namespace store {

Json::Value StorageStats::to_json() const {
  Json::Value value(Json::objectValue);
  value["used_bytes"] = static_cast<Json::Int64>(used_bytes);
  value["allocated_bytes"] = static_cast<Json::Int64>(allocated_bytes);
  value["free_bytes"] = static_cast<Json::Int64>(free_bytes);
  value["chunk_count"] = static_cast<Json::UInt64>(chunk_count);
  value["usage_percent"] = usage_percent;
  return value;
}

CapacityTracker::CapacityTracker(const std::filesystem::path& chunks_dir, std::int64_t allocated_bytes)
  : chunks_dir_(chunks_dir)
  , allocated_bytes_(allocated_bytes) {
  BOOST_LOG_TRIVIAL(debug) << "Capacity tracker: Tracking " << chunks_dir_.string()
                           << " with allocation of " << allocated_bytes_ << " bytes";
}

StorageStats CapacityTracker::stats() const {
  StorageStats stats;
  stats.allocated_bytes = allocated_bytes_;

  // No locking: files appearing or vanishing mid-scan are simply counted or skipped
  std::error_code ec;
  std::filesystem::directory_iterator it(chunks_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Capacity tracker: Chunk directory unavailable: " << ec.message();
  }

  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || it->path().extension() != CHUNK_SUFFIX) {
      continue;
    }

    std::uintmax_t size = it->file_size(entry_ec);
    if (entry_ec) {
      continue;
    }

    stats.used_bytes += static_cast<std::int64_t>(size);
    ++stats.chunk_count;
  }

  stats.free_bytes = stats.allocated_bytes - stats.used_bytes;
  if (stats.allocated_bytes > 0) {
    stats.usage_percent = static_cast<double>(stats.used_bytes) / static_cast<double>(stats.allocated_bytes) * 100.0;
  }

  BOOST_LOG_TRIVIAL(trace) << "Capacity tracker: " << stats.chunk_count << " chunks, "
                           << stats.used_bytes << " bytes used";
  return stats;
}

} // namespace store
} // namespace chunknode
