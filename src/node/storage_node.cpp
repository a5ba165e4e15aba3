#include "node/storage_node.hpp"
#include <boost/log/trivial.hpp>

namespace chunknode {
namespace node {

StorageNode::StorageNode(const config::NodeConfig& config, std::shared_ptr<coordinator::HttpClient> http_client)
  : config_(config)
  , http_client_(std::move(http_client)) {

  std::string seed_id = config_.node_id.empty() ? config::generate_node_id() : config_.node_id;
  BOOST_LOG_TRIVIAL(info) << "Storage node: Initializing storage node at " << config_.storage_path;

  try {
    // Storage first, everything else reads from it
    chunk_store_ = std::make_unique<store::ChunkStore>(config_.storage_path, config_.allocated_bytes(),
                                                       seed_id, config_.strict_verification);

    // The storage directory keeps the id it was created with
    node_id_ = chunk_store_->node_id();
    if (!config_.node_id.empty() && config_.node_id != node_id_) {
      BOOST_LOG_TRIVIAL(warning) << "Storage node: Ignoring configured node id " << config_.node_id
                                 << ", storage directory belongs to " << node_id_;
    }

    service_ = std::make_unique<network::NodeService>(*chunk_store_);
    BOOST_LOG_TRIVIAL(debug) << "Storage node: Node service created successfully";

    network::HttpServerOptions server_options;
    server_options.worker_threads = config_.worker_threads;
    server_options.max_body_bytes = config_.max_body_bytes();
    http_server_ = std::make_unique<network::HttpServer>(config_.listen_address, config_.port,
                                                         *service_, server_options);
    BOOST_LOG_TRIVIAL(debug) << "Storage node: HTTP server created successfully";

    BOOST_LOG_TRIVIAL(info) << "Storage node: Node " << node_id_ << " created with "
                            << config_.allocated_gb << " GB allocated";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage node: Failed to initialize components: " << e.what();
    throw;
  }
}

bool StorageNode::start() {
  try {
    chunk_store_->audit();

    if (!http_server_->start_listener()) {
      BOOST_LOG_TRIVIAL(error) << "Storage node: Failed to start HTTP server";
      return false;
    }

    // Built after binding so the advertised address carries the real port
    coordinator::CoordinatorOptions options;
    options.coordinator_url = config_.coordinator_url;
    options.node_address = "http://" + config_.advertise_host + ":" + std::to_string(http_server_->bound_port());
    options.version = NODE_VERSION;
    options.heartbeat_interval = std::chrono::seconds(config_.heartbeat_seconds);

    coordinator_client_ = std::make_unique<coordinator::CoordinatorClient>(
      options, node_id_, chunk_store_->capacity(), http_client_);
    coordinator_client_->start();

    BOOST_LOG_TRIVIAL(info) << "Storage node: Node " << node_id_ << " serving on "
                            << config_.listen_address << ":" << http_server_->bound_port();
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage node: Failed to start node: " << e.what();
    return false;
  }
}

bool StorageNode::shutdown() {
  try {
    BOOST_LOG_TRIVIAL(info) << "Storage node: Initiating shutdown sequence";

    // Coordinator first so no heartbeat reports a half-stopped node
    if (coordinator_client_) {
      BOOST_LOG_TRIVIAL(debug) << "Storage node: Stopping coordinator client";
      coordinator_client_->stop();
      coordinator_client_.reset();
    }

    if (http_server_) {
      BOOST_LOG_TRIVIAL(debug) << "Storage node: Shutting down HTTP server";
      http_server_->shutdown();
    }

    BOOST_LOG_TRIVIAL(info) << "Storage node: Shutdown complete";
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage node: Error during shutdown: " << e.what();
    return false;
  }
}

StorageNode::~StorageNode() {
  if (!shutdown()) {
    BOOST_LOG_TRIVIAL(error) << "Storage node: Failed to shutdown cleanly in destructor";
  }
}

} // namespace node
} // namespace chunknode
