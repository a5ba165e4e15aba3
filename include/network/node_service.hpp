#pragma once

#include <optional>
#include <string>
#include <boost/beast/http.hpp>
#include <json/value.h>
#include "network/upload_frame.hpp"
#include "store/chunk_store.hpp"

namespace chunknode {
namespace network {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Routes node API requests to the chunk store:
//   GET  /status           node id and capacity stats
//   GET  /chunk?id=<id>    raw chunk bytes
//   POST /chunk            framed upload (see upload_frame.hpp)
class NodeService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit NodeService(store::ChunkStore& chunk_store);


  // ---- REQUEST PROCESSING ----
  // Never throws; every failure becomes an error response
  HttpResponse handle(const HttpRequest& request);


  // ---- UTILITY METHODS ----
  // Returns the percent-decoded value of a query parameter in a request target
  static std::optional<std::string> query_param(const std::string& target, const std::string& name);
  static std::string url_decode(const std::string& value);

private:
  // ---- PARAMETERS ----
  store::ChunkStore& chunk_store_;
  UploadCodec codec_;


  // ---- ROUTE HANDLERS ----
  HttpResponse handle_status(const HttpRequest& request);
  HttpResponse handle_get_chunk(const HttpRequest& request);
  HttpResponse handle_post_chunk(const HttpRequest& request);


  // ---- RESPONSE BUILDING ----
  static HttpResponse json_response(const HttpRequest& request, boost::beast::http::status status,
                                    const Json::Value& body);
  static HttpResponse error_response(const HttpRequest& request, boost::beast::http::status status,
                                     const std::string& message);
};

} // namespace network
} // namespace chunknode
