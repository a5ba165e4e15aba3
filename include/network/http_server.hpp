#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "network/node_service.hpp"

namespace chunknode {
namespace network {

struct HttpServerOptions {
  std::size_t worker_threads{4};
  std::uint64_t max_body_bytes{64ull * 1024 * 1024};
  // Idle connections are dropped after this long without a complete request
  std::chrono::seconds request_timeout{30};
};

// One request per connection, handled on a pool of io_context threads
class HttpServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see bound_port()
  HttpServer(const std::string& address, uint16_t port, NodeService& service,
             const HttpServerOptions& options = HttpServerOptions());
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting and waits for in-flight requests to finish
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  uint16_t bound_port() const { return bound_port_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  uint16_t bound_port_;
  const HttpServerOptions options_;

  // Server state
  std::atomic<bool> is_running_;
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;

  // System components
  NodeService& service_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that hands each connection to a session
  void start_accept();
};

} // namespace network
} // namespace chunknode
