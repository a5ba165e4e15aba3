#include "store/chunk_store.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace chunknode {
namespace store {

namespace {

const char* const CHUNKS_SUBDIR = "chunks";
const char* const METADATA_FILE = "node_metadata.json";
const char* const TEMP_SUFFIX = ".tmp";
const std::size_t MAX_CHUNK_ID_LENGTH = 255;

double now_seconds() {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(since_epoch).count();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::filesystem::path& storage_path, std::int64_t allocated_bytes,
                       const std::string& node_id, bool strict_verification)
  : storage_path_(std::filesystem::absolute(storage_path))
  , chunks_dir_(storage_path_ / CHUNKS_SUBDIR)
  , strict_verification_(strict_verification)
  , capacity_(chunks_dir_, allocated_bytes)
  , metadata_(storage_path_ / METADATA_FILE, node_id) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initializing chunk store at " << storage_path_.string();

  try {
    std::filesystem::create_directories(chunks_dir_);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create chunk directory: " << e.what();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                     std::string("Chunk store: Failed to create chunk directory: ") + e.what());
  }

  metadata_.load();

  if (strict_verification_) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Strict verification enabled, unrecorded chunks are unreadable";
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Ready with allocation of " << allocated_bytes << " bytes";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::int64_t ChunkStore::store(const std::string& chunk_id, const std::string& payload, const std::string& file_id) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Storing chunk " << chunk_id << " (" << payload.size() << " bytes)";
  validate_chunk_id(chunk_id);

  // Admission is checked before any byte reaches the disk
  StorageStats current = capacity_.stats();
  std::int64_t payload_size = static_cast<std::int64_t>(payload.size());
  if (payload_size > current.free_bytes) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Rejecting chunk " << chunk_id << ", needs " << payload_size
                               << " bytes but only " << current.free_bytes << " free";
    throw StoreError(StoreErrorCode::INSUFFICIENT_SPACE, "Not enough free space");
  }

  ChunkRecord record;
  record.chunk_id = chunk_id;
  record.file_id = file_id;
  record.size = payload_size;
  record.created = now_seconds();
  record.checksum = compute_checksum(payload);

  {
    // File and record must describe the same payload
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::filesystem::path file_path = chunk_path(chunk_id);
    write_chunk_file(file_path, payload);

    try {
      metadata_.put_record(record);
    }
    catch (const StoreError& e) {
      // A file without a matching record would read as corrupted
      std::error_code ec;
      std::filesystem::remove(file_path, ec);
      BOOST_LOG_TRIVIAL(error) << "Chunk store: Dropped chunk " << chunk_id
                               << " after metadata failure: " << e.what();
      throw;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Stored chunk " << chunk_id << " (" << payload_size
                          << " bytes, checksum: " << record.checksum.substr(0, 8) << "...)";
  return payload_size;
}

std::string ChunkStore::retrieve(const std::string& chunk_id) const {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Retrieving chunk " << chunk_id;
  validate_chunk_id(chunk_id);

  std::filesystem::path file_path = chunk_path(chunk_id);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk not found: " << chunk_id;
    throw StoreError(StoreErrorCode::CHUNK_NOT_FOUND, "Chunk not found");
  }

  std::string data = read_chunk_file(file_path);

  auto record = metadata_.find_record(chunk_id);
  if (record) {
    std::string actual = compute_checksum(data);
    if (actual != record->checksum) {
      BOOST_LOG_TRIVIAL(error) << "Chunk store: Checksum mismatch for chunk " << chunk_id
                               << " (expected " << record->checksum << ", got " << actual << ")";
      throw StoreError(StoreErrorCode::CHUNK_CORRUPTED, "Chunk corrupted");
    }
  } else if (strict_verification_) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: No metadata record for chunk " << chunk_id;
    throw StoreError(StoreErrorCode::CHUNK_CORRUPTED, "Chunk corrupted: no metadata record");
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Serving chunk " << chunk_id << " unverified, no metadata record";
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Read chunk " << chunk_id << " (" << data.size() << " bytes)";
  return data;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::exists(const std::string& chunk_id) const {
  if (!is_valid_chunk_id(chunk_id)) {
    return false;
  }

  std::error_code ec;
  bool present = std::filesystem::is_regular_file(chunk_path(chunk_id), ec);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk " << chunk_id << (present ? " exists" : " not found");
  return present;
}

StorageStats ChunkStore::stats() const {
  return capacity_.stats();
}

std::string ChunkStore::node_id() const {
  return metadata_.node_id();
}

AuditReport ChunkStore::audit() const {
  AuditReport report;
  NodeMetadata snapshot = metadata_.snapshot();
  report.records = snapshot.chunks.size();

  for (const auto& [chunk_id, record] : snapshot.chunks) {
    std::error_code ec;
    std::filesystem::path file_path = chunk_path(chunk_id);
    if (!std::filesystem::is_regular_file(file_path, ec)) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Missing chunk file for record: " << chunk_id;
      ++report.missing_files;
      continue;
    }

    std::uintmax_t size = std::filesystem::file_size(file_path, ec);
    if (ec || static_cast<std::int64_t>(size) != record.size) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Size mismatch for chunk " << chunk_id
                                 << " (recorded " << record.size << ", on disk " << size << ")";
      ++report.size_mismatches;
    }
  }

  std::vector<std::filesystem::path> stale;
  std::error_code ec;
  std::filesystem::directory_iterator it(chunks_dir_, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (it->path().extension() == TEMP_SUFFIX && it->path().stem().extension() == CHUNK_SUFFIX) {
      stale.push_back(it->path());
      continue;
    }
    if (it->path().extension() != CHUNK_SUFFIX) {
      continue;
    }
    std::string chunk_id = it->path().stem().string();
    if (snapshot.chunks.find(chunk_id) == snapshot.chunks.end()) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Chunk file without metadata record: " << chunk_id;
      ++report.untracked_files;
    }
  }

  if (!stale.empty()) {
    // No write is in flight while the lock is held, so every temp file is stale
    std::lock_guard<std::mutex> lock(write_mutex_);
    for (const auto& temp_path : stale) {
      std::error_code remove_ec;
      if (std::filesystem::remove(temp_path, remove_ec)) {
        BOOST_LOG_TRIVIAL(warning) << "Chunk store: Removed stale temp file " << temp_path.filename().string();
        ++report.stale_temp_files;
      } else if (remove_ec) {
        BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to remove stale temp file "
                                 << temp_path.filename().string() << ": " << remove_ec.message();
      }
    }
  }

  if (report.clean()) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Audit found " << report.records << " consistent records";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Audit found " << report.missing_files << " missing, "
                               << report.size_mismatches << " mismatched and "
                               << report.untracked_files << " untracked chunks";
  }
  return report;
}


//==============================================
// FILE OPERATIONS
//==============================================

void ChunkStore::write_chunk_file(const std::filesystem::path& file_path, const std::string& payload) const {
  std::filesystem::path temp_path = file_path;
  temp_path += TEMP_SUFFIX;

  try {
    {
      // Open output file in binary mode, payloads are opaque bytes
      std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                         "Chunk store: Failed to create file: " + temp_path.string());
      }

      file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
      file.flush();
      if (!file.good()) {
        throw StoreError(StoreErrorCode::STORAGE_FAILURE,
                         "Chunk store: Failed to write file: " + temp_path.string());
      }
    }

    std::filesystem::rename(temp_path, file_path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to persist chunk file: " << e.what();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, e.what());
  }
  catch (const StoreError& e) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << e.what();
    throw;
  }
}

std::string ChunkStore::read_chunk_file(const std::filesystem::path& file_path) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to open file: " << file_path.string();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to open file: " + file_path.string());
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to read file: " << file_path.string();
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to read file: " + file_path.string());
  }
  return buffer.str();
}


//==============================================
// PATH RESOLUTION
//==============================================

std::filesystem::path ChunkStore::chunk_path(const std::string& chunk_id) const {
  return chunks_dir_ / (chunk_id + CHUNK_SUFFIX);
}

void ChunkStore::validate_chunk_id(const std::string& chunk_id) const {
  if (!is_valid_chunk_id(chunk_id)) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Rejecting invalid chunk id: " << chunk_id;
    throw StoreError(StoreErrorCode::INVALID_CHUNK_ID, "Invalid chunk id");
  }
}

bool ChunkStore::is_valid_chunk_id(const std::string& chunk_id) {
  if (chunk_id.empty() || chunk_id.size() > MAX_CHUNK_ID_LENGTH) {
    return false;
  }
  if (chunk_id == "." || chunk_id == "..") {
    return false;
  }
  return chunk_id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string ChunkStore::compute_checksum(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw StoreError(StoreErrorCode::STORAGE_FAILURE, "Chunk store: Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace store
} // namespace chunknode
