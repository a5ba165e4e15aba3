#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace chunknode::store;

class ChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ChunkStore> store;

  static constexpr std::int64_t ALLOCATION = 1024 * 1024;

  void SetUp() override {
    chunknode::test::init_test_logging();
    test_dir = chunknode::test::make_temp_dir("chunk_store_test");
    store = std::make_unique<ChunkStore>(test_dir, ALLOCATION, "node_test");
  }

  void TearDown() override {
    store.reset();
    chunknode::test::remove_temp_dir(test_dir);
  }

  void expect_error(const std::function<void()>& fn, StoreErrorCode code) {
    try {
      fn();
      FAIL() << "Expected StoreError: " << store_error_to_string(code);
    } catch (const StoreError& e) {
      EXPECT_EQ(e.code(), code) << e.what();
    }
  }

  void overwrite_file(const std::string& chunk_id, const std::string& content) {
    std::ofstream file(store->chunks_dir() / (chunk_id + ".chunk"), std::ios::binary | std::ios::trunc);
    file << content;
  }
};

TEST_F(ChunkStoreTest, CreatesLayout) {
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "chunks"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "node_metadata.json"));
  EXPECT_EQ(store->node_id(), "node_test");
}

TEST_F(ChunkStoreTest, StoreAndRetrieve) {
  const std::string data = "Hello, chunk!";
  EXPECT_EQ(store->store("abc", data, "file1"), static_cast<std::int64_t>(data.size()));

  EXPECT_TRUE(store->exists("abc"));
  EXPECT_EQ(store->retrieve("abc"), data);
  EXPECT_TRUE(std::filesystem::exists(store->chunks_dir() / "abc.chunk"));

  auto record = store->metadata().find_record("abc");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->file_id, "file1");
  EXPECT_EQ(record->size, static_cast<std::int64_t>(data.size()));
  EXPECT_EQ(record->checksum, ChunkStore::compute_checksum(data));
  EXPECT_GT(record->created, 0.0);
}

TEST_F(ChunkStoreTest, BinaryPayload) {
  std::string data;
  for (int i = 0; i < 512; ++i) {
    data.push_back(static_cast<char>(i % 256));
  }

  store->store("bin", data, "f");
  EXPECT_EQ(store->retrieve("bin"), data);
}

TEST_F(ChunkStoreTest, EmptyPayload) {
  EXPECT_EQ(store->store("empty", "", "f"), 0);
  EXPECT_EQ(store->retrieve("empty"), "");
  EXPECT_EQ(store->stats().chunk_count, 1u);
}

TEST_F(ChunkStoreTest, ChecksumIsSha256Hex) {
  EXPECT_EQ(ChunkStore::compute_checksum(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(ChunkStore::compute_checksum("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChunkStoreTest, InsufficientSpaceLeavesStorageUnchanged) {
  store->store("fill", std::string(ALLOCATION - 10, 'x'), "f");
  auto before = chunknode::test::chunk_dir_usage(store->chunks_dir());

  expect_error([&] { store->store("big", std::string(11, 'y'), "f"); }, StoreErrorCode::INSUFFICIENT_SPACE);

  auto after = chunknode::test::chunk_dir_usage(store->chunks_dir());
  EXPECT_EQ(before, after);
  EXPECT_FALSE(store->exists("big"));
  EXPECT_FALSE(store->metadata().find_record("big").has_value());

  // Exactly the remaining space still fits
  EXPECT_NO_THROW(store->store("fits", std::string(10, 'z'), "f"));
  EXPECT_EQ(store->stats().free_bytes, 0);
}

TEST_F(ChunkStoreTest, RetrieveMissingChunk) {
  EXPECT_FALSE(store->exists("nope"));
  expect_error([&] { store->retrieve("nope"); }, StoreErrorCode::CHUNK_NOT_FOUND);
}

TEST_F(ChunkStoreTest, TamperedChunkIsCorrupted) {
  store->store("c1", "original data", "f");
  overwrite_file("c1", "tampered data");

  expect_error([&] { store->retrieve("c1"); }, StoreErrorCode::CHUNK_CORRUPTED);
}

TEST_F(ChunkStoreTest, UnrecordedChunkServedWhenPermissive) {
  overwrite_file("orphan", "no record");
  EXPECT_EQ(store->retrieve("orphan"), "no record");
}

TEST_F(ChunkStoreTest, UnrecordedChunkRejectedWhenStrict) {
  store.reset();
  store = std::make_unique<ChunkStore>(test_dir, ALLOCATION, "node_test", true);

  overwrite_file("orphan", "no record");
  expect_error([&] { store->retrieve("orphan"); }, StoreErrorCode::CHUNK_CORRUPTED);

  store->store("tracked", "ok", "f");
  EXPECT_EQ(store->retrieve("tracked"), "ok");
}

TEST_F(ChunkStoreTest, InvalidChunkIds) {
  const std::vector<std::string> invalid = {"", ".", "..", "../escape", "a/b", "a\\b",
                                            std::string("a\0b", 3), std::string(256, 'x')};
  for (const auto& id : invalid) {
    EXPECT_FALSE(ChunkStore::is_valid_chunk_id(id));
    EXPECT_FALSE(store->exists(id));
    expect_error([&] { store->store(id, "data", "f"); }, StoreErrorCode::INVALID_CHUNK_ID);
    expect_error([&] { store->retrieve(id); }, StoreErrorCode::INVALID_CHUNK_ID);
  }

  EXPECT_TRUE(ChunkStore::is_valid_chunk_id("a1b2c3-d4e5"));
  EXPECT_TRUE(ChunkStore::is_valid_chunk_id(std::string(255, 'x')));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "escape.chunk"));
}

TEST_F(ChunkStoreTest, OverwriteReplacesDataAndRecord) {
  store->store("c1", "first version", "f1");
  store->store("c1", "second", "f2");

  EXPECT_EQ(store->retrieve("c1"), "second");
  auto record = store->metadata().find_record("c1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->file_id, "f2");
  EXPECT_EQ(record->size, 6);
  EXPECT_EQ(store->stats().chunk_count, 1u);
  EXPECT_EQ(store->metadata().snapshot().total_stored, 6);
}

TEST_F(ChunkStoreTest, StatsTrackStoredChunks) {
  store->store("a", std::string(1000, 'a'), "f");
  store->store("b", std::string(2000, 'b'), "f");

  StorageStats stats = store->stats();
  EXPECT_EQ(stats.used_bytes, 3000);
  EXPECT_EQ(stats.chunk_count, 2u);
  EXPECT_EQ(stats.free_bytes, ALLOCATION - 3000);
}

TEST_F(ChunkStoreTest, ConcurrentStoresKeepEveryRecord) {
  const int thread_count = 8;
  const int per_thread = 10;
  std::vector<std::thread> threads;

  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([this, t, per_thread]() {
      for (int i = 0; i < per_thread; ++i) {
        std::string id = "chunk_" + std::to_string(t) + "_" + std::to_string(i);
        store->store(id, "payload " + id, "file_" + std::to_string(t));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  store.reset();
  ChunkStore reloaded(test_dir, ALLOCATION, "ignored");
  NodeMetadata metadata = reloaded.metadata().snapshot();
  EXPECT_EQ(metadata.chunks.size(), static_cast<std::size_t>(thread_count * per_thread));
  EXPECT_EQ(reloaded.node_id(), "node_test");

  for (const auto& [id, record] : metadata.chunks) {
    EXPECT_EQ(reloaded.retrieve(id), "payload " + id);
  }
}

TEST_F(ChunkStoreTest, AuditReportsInconsistencies) {
  store->store("good", "good data", "f");
  store->store("gone", "soon missing", "f");
  store->store("resized", "short", "f");
  EXPECT_TRUE(store->audit().clean());

  std::filesystem::remove(store->chunks_dir() / "gone.chunk");
  overwrite_file("resized", "much longer content");
  overwrite_file("stray", "untracked");

  AuditReport report = store->audit();
  EXPECT_EQ(report.records, 3u);
  EXPECT_EQ(report.missing_files, 1u);
  EXPECT_EQ(report.size_mismatches, 1u);
  EXPECT_EQ(report.untracked_files, 1u);
  EXPECT_FALSE(report.clean());
}

TEST_F(ChunkStoreTest, ConcurrentStoresOfSameIdStayConsistent) {
  const int thread_count = 4;
  const std::size_t payload_size = 200000;

  for (int round = 0; round < 20; ++round) {
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
      threads.emplace_back([this, t, payload_size, &failures]() {
        try {
          store->store("same", std::string(payload_size, static_cast<char>('a' + t)), "file_same");
        } catch (const StoreError& e) {
          ADD_FAILURE() << "Store failed: " << e.what();
          ++failures;
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    ASSERT_EQ(failures.load(), 0) << "round " << round;
    std::string data;
    ASSERT_NO_THROW(data = store->retrieve("same")) << "round " << round;
    ASSERT_EQ(data.size(), payload_size);
    EXPECT_EQ(data.find_first_not_of(data.front()), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(store->chunks_dir() / "same.chunk.tmp"));
  }
}

TEST_F(ChunkStoreTest, ChunkWriteFailureIsStorageFailure) {
  // A non-empty directory where the chunk file belongs makes the rename fail
  std::filesystem::create_directories(store->chunks_dir() / "blocked.chunk");
  std::ofstream(store->chunks_dir() / "blocked.chunk" / "keep") << "x";

  try {
    store->store("blocked", "payload", "f");
    FAIL() << "Expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.code(), StoreErrorCode::STORAGE_FAILURE);
    EXPECT_FALSE(std::string(e.what()).empty());
  }

  EXPECT_FALSE(std::filesystem::exists(store->chunks_dir() / "blocked.chunk.tmp"));
  EXPECT_FALSE(store->metadata().find_record("blocked").has_value());
  EXPECT_EQ(chunknode::test::chunk_dir_usage(store->chunks_dir()).first, 0u);
}

TEST_F(ChunkStoreTest, MetadataWriteFailureDropsChunk) {
  store->store("first", "kept", "f");

  // A non-empty directory at the metadata temp path blocks every save
  std::filesystem::path blocker = test_dir / "node_metadata.json.tmp";
  std::filesystem::create_directories(blocker);
  std::ofstream(blocker / "keep") << "x";

  expect_error([&] { store->store("second", "lost", "f"); }, StoreErrorCode::STORAGE_FAILURE);

  EXPECT_FALSE(std::filesystem::exists(store->chunks_dir() / "second.chunk"));
  EXPECT_FALSE(std::filesystem::exists(store->chunks_dir() / "second.chunk.tmp"));
  EXPECT_FALSE(store->metadata().find_record("second").has_value());
  EXPECT_EQ(store->retrieve("first"), "kept");

  std::filesystem::remove_all(blocker);
  EXPECT_NO_THROW(store->store("second", "stored", "f"));
  EXPECT_EQ(store->retrieve("second"), "stored");
}

TEST_F(ChunkStoreTest, AuditRemovesStaleTempFiles) {
  store->store("good", "good data", "f");
  std::ofstream(store->chunks_dir() / "crashed.chunk.tmp") << "half written";
  std::ofstream(store->chunks_dir() / "notes.tmp") << "not ours";

  AuditReport report = store->audit();
  EXPECT_EQ(report.stale_temp_files, 1u);
  EXPECT_EQ(report.untracked_files, 0u);
  EXPECT_TRUE(report.clean());
  EXPECT_FALSE(std::filesystem::exists(store->chunks_dir() / "crashed.chunk.tmp"));
  EXPECT_TRUE(std::filesystem::exists(store->chunks_dir() / "notes.tmp"));
  EXPECT_EQ(store->retrieve("good"), "good data");
}
