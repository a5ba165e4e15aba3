#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <json/value.h>
#include "coordinator/http_client.hpp"
#include "store/capacity_tracker.hpp"

namespace chunknode::coordinator {

struct CoordinatorOptions {
  // Base URL, e.g. http://localhost:3000/api
  std::string coordinator_url;
  // Address peers use to reach this node, e.g. http://10.0.0.5:8420
  std::string node_address;
  std::string version;
  std::chrono::milliseconds register_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds heartbeat_timeout{std::chrono::seconds(5)};
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
};

// Registers the node once and reports capacity on a fixed interval.
// Failures are logged and never reach the caller.
class CoordinatorClient {
public:
  // Delete copy constructor and assignment operator
  CoordinatorClient(const CoordinatorClient&) = delete;
  CoordinatorClient& operator=(const CoordinatorClient&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CoordinatorClient(const CoordinatorOptions& options, const std::string& node_id,
                    const store::CapacityTracker& capacity,
                    std::shared_ptr<HttpClient> http_client = std::make_shared<HttpClient>());
  ~CoordinatorClient();


  // ---- COORDINATOR CALLS ----
  // POST {coordinator_url}/nodes/register; returns false on any failure
  bool register_node();
  // POST {coordinator_url}/nodes/heartbeat; returns false on any failure
  bool send_heartbeat();


  // ---- BACKGROUND TASK ----
  // Registers, then heartbeats every interval until stop() on a dedicated thread
  void start();
  // Wakes the task and joins it; an in-flight call finishes within its timeout
  void stop();
  bool is_running() const { return running_; }


  // ---- PAYLOADS ----
  Json::Value registration_payload() const;
  Json::Value heartbeat_payload() const;


  // ---- GETTERS ----
  std::uint64_t heartbeats_sent() const { return heartbeats_sent_; }
  std::uint64_t heartbeats_failed() const { return heartbeats_failed_; }

private:
  // ---- PARAMETERS ----
  CoordinatorOptions options_;
  std::string node_id_;
  const store::CapacityTracker& capacity_;
  std::shared_ptr<HttpClient> http_client_;

  // Background task state
  std::atomic<bool> running_{false};
  std::unique_ptr<std::thread> task_thread_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};

  // Counters
  std::atomic<std::uint64_t> heartbeats_sent_{0};
  std::atomic<std::uint64_t> heartbeats_failed_{0};


  // ---- BACKGROUND TASK ----
  void run_task();


  // ---- UTILITY METHODS ----
  std::string endpoint(const std::string& path) const;
  // Sends one request; throws CoordinatorError on failure
  void post(const std::string& path, const Json::Value& payload, std::chrono::milliseconds timeout);
};

} // namespace chunknode::coordinator
