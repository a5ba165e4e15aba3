#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "store/capacity_tracker.hpp"
#include "test_utils.hpp"

using namespace chunknode::store;

namespace {

const std::int64_t ONE_GB = 1024LL * 1024 * 1024;

} // namespace

class CapacityTrackerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    chunknode::test::init_test_logging();
    test_dir = chunknode::test::make_temp_dir("capacity_test");
  }

  void TearDown() override {
    chunknode::test::remove_temp_dir(test_dir);
  }

  void write_file(const std::string& name, std::size_t size) {
    std::ofstream file(test_dir / name, std::ios::binary);
    file << std::string(size, 'x');
  }
};

TEST_F(CapacityTrackerTest, EmptyDirectory) {
  CapacityTracker tracker(test_dir, ONE_GB);
  StorageStats stats = tracker.stats();

  EXPECT_EQ(stats.used_bytes, 0);
  EXPECT_EQ(stats.allocated_bytes, ONE_GB);
  EXPECT_EQ(stats.free_bytes, ONE_GB);
  EXPECT_EQ(stats.chunk_count, 0u);
  EXPECT_DOUBLE_EQ(stats.usage_percent, 0.0);
}

TEST_F(CapacityTrackerTest, CountsOnlyChunkFiles) {
  write_file("a.chunk", 1000);
  write_file("b.chunk", 2000);
  write_file("b.chunk.tmp", 500);
  write_file("notes.txt", 700);
  std::filesystem::create_directories(test_dir / "nested.chunk");

  CapacityTracker tracker(test_dir, ONE_GB);
  StorageStats stats = tracker.stats();

  EXPECT_EQ(stats.used_bytes, 3000);
  EXPECT_EQ(stats.chunk_count, 2u);
  EXPECT_EQ(stats.free_bytes, ONE_GB - 3000);
  EXPECT_DOUBLE_EQ(stats.usage_percent, 300000.0 / 1073741824.0);
}

TEST_F(CapacityTrackerTest, ReflectsChangesOnDisk) {
  CapacityTracker tracker(test_dir, ONE_GB);
  write_file("a.chunk", 10);
  EXPECT_EQ(tracker.stats().used_bytes, 10);

  std::filesystem::remove(test_dir / "a.chunk");
  EXPECT_EQ(tracker.stats().used_bytes, 0);
  EXPECT_EQ(tracker.stats().chunk_count, 0u);
}

TEST_F(CapacityTrackerTest, OverAllocationGivesNegativeFreeSpace) {
  write_file("a.chunk", 150);

  CapacityTracker tracker(test_dir, 100);
  StorageStats stats = tracker.stats();

  EXPECT_EQ(stats.free_bytes, -50);
  EXPECT_DOUBLE_EQ(stats.usage_percent, 150.0);
}

TEST_F(CapacityTrackerTest, MissingDirectoryReadsAsEmpty) {
  CapacityTracker tracker(test_dir / "does_not_exist", 100);
  StorageStats stats = tracker.stats();

  EXPECT_EQ(stats.used_bytes, 0);
  EXPECT_EQ(stats.chunk_count, 0u);
  EXPECT_EQ(stats.free_bytes, 100);
}

TEST_F(CapacityTrackerTest, JsonFields) {
  write_file("a.chunk", 25);
  Json::Value json = CapacityTracker(test_dir, 100).stats().to_json();

  EXPECT_EQ(json["used_bytes"].asInt64(), 25);
  EXPECT_EQ(json["allocated_bytes"].asInt64(), 100);
  EXPECT_EQ(json["free_bytes"].asInt64(), 75);
  EXPECT_EQ(json["chunk_count"].asUInt64(), 1u);
  EXPECT_DOUBLE_EQ(json["usage_percent"].asDouble(), 25.0);
}
