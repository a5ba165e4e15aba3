#pragma once

#include <memory>
#include <string>
#include "config/node_config.hpp"
#include "coordinator/coordinator_client.hpp"
#include "network/http_server.hpp"
#include "network/node_service.hpp"
#include "store/chunk_store.hpp"

namespace chunknode {
namespace node {

// Reported to the coordinator on registration
inline constexpr const char* NODE_VERSION = "1.0.0";

class StorageNode {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens the storage directory; throws StoreError if it cannot be used
  explicit StorageNode(const config::NodeConfig& config,
                       std::shared_ptr<coordinator::HttpClient> http_client = std::make_shared<coordinator::HttpClient>());
  ~StorageNode();


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts serving, then registers and heartbeats in the background
  bool start();
  // Stops the coordinator task and drains the HTTP server
  bool shutdown();


  // ---- GETTERS ----
  const std::string& node_id() const { return node_id_; }
  store::ChunkStore& get_chunk_store() { return *chunk_store_; }
  network::HttpServer& get_http_server() { return *http_server_; }
  // Null until start()
  coordinator::CoordinatorClient* get_coordinator_client() { return coordinator_client_.get(); }

private:
  // ---- PARAMETERS ----
  config::NodeConfig config_;
  std::string node_id_;
  std::shared_ptr<coordinator::HttpClient> http_client_;

  // System components
  std::unique_ptr<store::ChunkStore> chunk_store_;
  std::unique_ptr<network::NodeService> service_;
  std::unique_ptr<network::HttpServer> http_server_;
  std::unique_ptr<coordinator::CoordinatorClient> coordinator_client_;
};

} // namespace node
} // namespace chunknode
