#include "config/node_config.hpp"
#include "logger/logger.hpp"
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace chunknode {
namespace config {

namespace {

const std::uint64_t BYTES_PER_GB = 1024ull * 1024 * 1024;

std::uint64_t parse_number(const std::string& flag, const std::string& value,
                           std::uint64_t min, std::uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("Invalid value for " + flag + ": " + value);
  }

  std::uint64_t number = 0;
  try {
    number = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ConfigError("Value out of range for " + flag + ": " + value);
  }

  if (number < min || number > max) {
    throw ConfigError("Value out of range for " + flag + ": " + value);
  }
  return number;
}

} // namespace

//==============================================
// DERIVED VALUES
//==============================================

std::int64_t NodeConfig::allocated_bytes() const {
  return static_cast<std::int64_t>(allocated_gb * BYTES_PER_GB);
}


//==============================================
// COMMAND LINE
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -s, --storage <path>          Storage directory (default: ./node_storage)\n"
      << "  -g, --allocated-gb <GB>       Allocated capacity in GB (default: 100)\n"
      << "  -c, --coordinator <url>       Coordinator base URL (default: http://localhost:3000/api)\n"
      << "  -a, --address <addr>          Listen address (default: 0.0.0.0)\n"
      << "  -p, --port <port>             Listen port (default: 8420)\n"
      << "      --advertise-host <host>   Host reported to the coordinator (default: 127.0.0.1)\n"
      << "  -n, --node-id <id>            Node id (default: from metadata, else generated)\n"
      << "      --strict                  Treat chunks without metadata as corrupted\n"
      << "  -l, --log-file <path>         Also log to this file\n"
      << "      --log-level <level>       trace, debug, info, warning, error, fatal (default: info)\n"
      << "  -w, --workers <n>             HTTP worker threads (default: 4)\n"
      << "      --heartbeat-seconds <n>   Heartbeat interval (default: 30)\n"
      << "      --max-body-mb <n>         Largest accepted upload in MiB (default: 64)\n"
      << "  -h, --help                    Show this help message\n"
      << "Example: " << program_name << " -s /var/lib/chunknode -g 50 -c http://coordinator:3000/api\n";
}

NodeConfig parse_command_line(int argc, const char* const argv[]) {
  NodeConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    // Flags without a value
    if (flag == "-h" || flag == "--help") {
      config.show_help = true;
      continue;
    }
    if (flag == "--strict") {
      config.strict_verification = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw ConfigError("Missing value for " + flag);
    }
    const std::string value(argv[++i]);

    if (flag == "-s" || flag == "--storage") {
      config.storage_path = value;
    } else if (flag == "-g" || flag == "--allocated-gb") {
      config.allocated_gb = parse_number(flag, value, 1, std::numeric_limits<std::int64_t>::max() / BYTES_PER_GB);
    } else if (flag == "-c" || flag == "--coordinator") {
      config.coordinator_url = value;
    } else if (flag == "-a" || flag == "--address") {
      config.listen_address = value;
    } else if (flag == "-p" || flag == "--port") {
      config.port = static_cast<uint16_t>(parse_number(flag, value, 1, std::numeric_limits<uint16_t>::max()));
    } else if (flag == "--advertise-host") {
      config.advertise_host = value;
    } else if (flag == "-n" || flag == "--node-id") {
      config.node_id = value;
    } else if (flag == "-l" || flag == "--log-file") {
      config.log_file = value;
    } else if (flag == "--log-level") {
      if (!logging::parse_log_level(value, config.log_level)) {
        throw ConfigError("Invalid log level: " + value);
      }
    } else if (flag == "-w" || flag == "--workers") {
      config.worker_threads = static_cast<std::size_t>(parse_number(flag, value, 1, 256));
    } else if (flag == "--heartbeat-seconds") {
      config.heartbeat_seconds = parse_number(flag, value, 1, 24 * 60 * 60);
    } else if (flag == "--max-body-mb") {
      config.max_body_mb = parse_number(flag, value, 1, 4096);
    } else {
      throw ConfigError("Unknown argument: " + flag);
    }
  }

  return config;
}


//==============================================
// NODE IDENTITY
//==============================================

std::string generate_node_id() {
  std::random_device rd;  // Used to obtain a seed for the random number engine
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint64_t> dis;

  std::stringstream ss;
  ss << "node_" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
  return ss.str();
}

} // namespace config
} // namespace chunknode
