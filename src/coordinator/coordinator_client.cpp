#include "coordinator/coordinator_client.hpp"
#include <boost/log/trivial.hpp>

namespace chunknode::coordinator {

namespace {

double now_seconds() {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(since_epoch).count();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CoordinatorClient::CoordinatorClient(const CoordinatorOptions& options, const std::string& node_id,
                                     const store::CapacityTracker& capacity,
                                     std::shared_ptr<HttpClient> http_client)
  : options_(options)
  , node_id_(node_id)
  , capacity_(capacity)
  , http_client_(std::move(http_client)) {
  BOOST_LOG_TRIVIAL(info) << "Coordinator client: Reporting node " << node_id_
                          << " to " << options_.coordinator_url;
}

CoordinatorClient::~CoordinatorClient() {
  stop();
}


//==============================================
// COORDINATOR CALLS
//==============================================

bool CoordinatorClient::register_node() {
  try {
    post("/nodes/register", registration_payload(), options_.register_timeout);
    BOOST_LOG_TRIVIAL(info) << "Coordinator client: Registered with coordinator at " << options_.coordinator_url;
    return true;
  }
  catch (const CoordinatorError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Coordinator client: Registration failed: " << e.what();
    return false;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Coordinator client: Unexpected registration error: " << e.what();
    return false;
  }
}

bool CoordinatorClient::send_heartbeat() {
  try {
    post("/nodes/heartbeat", heartbeat_payload(), options_.heartbeat_timeout);
    ++heartbeats_sent_;
    BOOST_LOG_TRIVIAL(debug) << "Coordinator client: Heartbeat sent";
    return true;
  }
  catch (const CoordinatorError& e) {
    ++heartbeats_failed_;
    BOOST_LOG_TRIVIAL(warning) << "Coordinator client: Heartbeat failed: " << e.what();
    return false;
  }
  catch (const std::exception& e) {
    ++heartbeats_failed_;
    BOOST_LOG_TRIVIAL(error) << "Coordinator client: Unexpected heartbeat error: " << e.what();
    return false;
  }
}

void CoordinatorClient::post(const std::string& path, const Json::Value& payload,
                             std::chrono::milliseconds timeout) {
  Json::Value response = http_client_->post_json(endpoint(path), payload, timeout);

  // The coordinator reports refusals as {success: false, error: ...}
  if (response.isObject() && response["success"].isBool() && !response["success"].asBool()) {
    std::string reason = response["error"].isString() ? response["error"].asString() : "unspecified";
    throw CoordinatorRejected(reason);
  }
}


//==============================================
// BACKGROUND TASK
//==============================================

void CoordinatorClient::start() {
  if (running_) {
    BOOST_LOG_TRIVIAL(warning) << "Coordinator client: Background task already running";
    return;
  }

  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  task_thread_ = std::make_unique<std::thread>(&CoordinatorClient::run_task, this);
}

void CoordinatorClient::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (task_thread_ && task_thread_->joinable()) {
    task_thread_->join();
    BOOST_LOG_TRIVIAL(info) << "Coordinator client: Background task stopped";
  }
  task_thread_.reset();
  running_ = false;
}

void CoordinatorClient::run_task() {
  // Registration failure is not fatal, heartbeats carry on regardless
  register_node();

  std::unique_lock<std::mutex> lock(stop_mutex_);
  while (!stop_requested_) {
    if (stop_cv_.wait_for(lock, options_.heartbeat_interval, [this]() { return stop_requested_; })) {
      break;
    }

    lock.unlock();
    send_heartbeat();
    lock.lock();
  }

  BOOST_LOG_TRIVIAL(debug) << "Coordinator client: Background task exiting";
}


//==============================================
// PAYLOADS
//==============================================

Json::Value CoordinatorClient::registration_payload() const {
  Json::Value payload(Json::objectValue);
  payload["node_id"] = node_id_;
  payload["address"] = options_.node_address;
  payload["storage_stats"] = capacity_.stats().to_json();
  payload["status"] = "online";
  payload["version"] = options_.version;
  return payload;
}

Json::Value CoordinatorClient::heartbeat_payload() const {
  Json::Value payload(Json::objectValue);
  payload["node_id"] = node_id_;
  payload["storage_stats"] = capacity_.stats().to_json();
  payload["timestamp"] = now_seconds();
  return payload;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string CoordinatorClient::endpoint(const std::string& path) const {
  std::string base = options_.coordinator_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + path;
}

} // namespace chunknode::coordinator
