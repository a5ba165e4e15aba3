#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace chunknode {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct NodeConfig {
  std::string storage_path{"./node_storage"};
  std::uint64_t allocated_gb{100};
  std::string coordinator_url{"http://localhost:3000/api"};
  std::string listen_address{"0.0.0.0"};
  uint16_t port{8420};
  // Host the coordinator hands out to clients
  std::string advertise_host{"127.0.0.1"};
  // Empty: reuse the id in existing metadata, else generate one
  std::string node_id;
  bool strict_verification{false};
  std::string log_file;
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  std::size_t worker_threads{4};
  std::uint64_t heartbeat_seconds{30};
  std::uint64_t max_body_mb{64};
  bool show_help{false};

  std::int64_t allocated_bytes() const;
  std::uint64_t max_body_bytes() const { return max_body_mb * 1024 * 1024; }
};

// ---- COMMAND LINE ----
// Throws ConfigError on unknown flags, missing values or invalid numbers
NodeConfig parse_command_line(int argc, const char* const argv[]);
void print_usage(std::ostream& out, const std::string& program_name);


// ---- NODE IDENTITY ----
// "node_" followed by 16 random lowercase hex characters
std::string generate_node_id();

} // namespace config
} // namespace chunknode
