#include "network/node_service.hpp"
#include <boost/log/trivial.hpp>
#include <json/writer.h>

namespace chunknode {
namespace network {

namespace http = boost::beast::http;

namespace {

const char* const SERVER_NAME = "chunknode";

std::string view_to_string(boost::beast::string_view view) {
  return std::string(view.data(), view.size());
}

std::string request_path(const std::string& target) {
  return target.substr(0, target.find('?'));
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

NodeService::NodeService(store::ChunkStore& chunk_store)
  : chunk_store_(chunk_store) {
  BOOST_LOG_TRIVIAL(debug) << "Node service: Routing requests for node " << chunk_store_.node_id();
}


//==============================================
// REQUEST PROCESSING
//==============================================

HttpResponse NodeService::handle(const HttpRequest& request) {
  std::string target = view_to_string(request.target());
  std::string path = request_path(target);
  BOOST_LOG_TRIVIAL(debug) << "Node service: " << request.method_string() << " " << target;

  try {
    if (path == "/status" && request.method() == http::verb::get) {
      return handle_status(request);
    }
    if (path == "/chunk" && request.method() == http::verb::get) {
      return handle_get_chunk(request);
    }
    if (path == "/chunk" && request.method() == http::verb::post) {
      return handle_post_chunk(request);
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node service: Unhandled error for " << target << ": " << e.what();
    return error_response(request, http::status::internal_server_error, e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Node service: No route for " << request.method_string() << " " << path;
  return error_response(request, http::status::not_found, "Not found");
}


//==============================================
// ROUTE HANDLERS
//==============================================

HttpResponse NodeService::handle_status(const HttpRequest& request) {
  Json::Value body(Json::objectValue);
  body["node_id"] = chunk_store_.node_id();
  body["status"] = "online";
  body["storage"] = chunk_store_.stats().to_json();
  return json_response(request, http::status::ok, body);
}

HttpResponse NodeService::handle_get_chunk(const HttpRequest& request) {
  auto chunk_id = query_param(view_to_string(request.target()), "id");
  if (!chunk_id) {
    return error_response(request, http::status::bad_request, "Missing chunk id");
  }

  try {
    std::string data = chunk_store_.retrieve(*chunk_id);

    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::server, SERVER_NAME);
    response.set(http::field::content_type, "application/octet-stream");
    response.keep_alive(false);
    response.body() = std::move(data);
    response.prepare_payload();
    return response;
  }
  catch (const store::StoreError& e) {
    switch (e.code()) {
      case store::StoreErrorCode::INVALID_CHUNK_ID:
        return error_response(request, http::status::bad_request, e.what());
      case store::StoreErrorCode::CHUNK_NOT_FOUND:
      case store::StoreErrorCode::CHUNK_CORRUPTED:
        // A corrupted chunk is unavailable, never served
        return error_response(request, http::status::not_found, e.what());
      default:
        return error_response(request, http::status::internal_server_error, e.what());
    }
  }
}

HttpResponse NodeService::handle_post_chunk(const HttpRequest& request) {
  try {
    std::string metadata_length = view_to_string(request[METADATA_LENGTH_HEADER]);
    UploadFrame frame = codec_.deserialize(metadata_length, request.body());

    std::int64_t stored = chunk_store_.store(frame.chunk_id, frame.payload, frame.file_id);

    Json::Value body(Json::objectValue);
    body["success"] = true;
    body["stored_bytes"] = static_cast<Json::Int64>(stored);
    return json_response(request, http::status::ok, body);
  }
  catch (const FrameError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Node service: Rejected upload: " << e.what();
    return error_response(request, http::status::internal_server_error, e.what());
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Node service: Store failed: "
                               << store::store_error_to_string(e.code()) << ": " << e.what();
    return error_response(request, http::status::internal_server_error, e.what());
  }
}


//==============================================
// RESPONSE BUILDING
//==============================================

HttpResponse NodeService::json_response(const HttpRequest& request, http::status status, const Json::Value& body) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";

  HttpResponse response{status, request.version()};
  response.set(http::field::server, SERVER_NAME);
  response.set(http::field::content_type, "application/json");
  response.keep_alive(false);
  response.body() = Json::writeString(builder, body);
  response.prepare_payload();
  return response;
}

HttpResponse NodeService::error_response(const HttpRequest& request, http::status status, const std::string& message) {
  Json::Value body(Json::objectValue);
  body["success"] = false;
  body["error"] = message;
  return json_response(request, status, body);
}


//==============================================
// UTILITY METHODS
//==============================================

std::optional<std::string> NodeService::query_param(const std::string& target, const std::string& name) {
  std::size_t query_start = target.find('?');
  if (query_start == std::string::npos) {
    return std::nullopt;
  }

  std::string query = target.substr(query_start + 1);
  std::size_t pos = 0;
  while (pos <= query.size()) {
    std::size_t end = query.find('&', pos);
    if (end == std::string::npos) {
      end = query.size();
    }

    std::string pair = query.substr(pos, end - pos);
    std::size_t eq = pair.find('=');
    std::string key = url_decode(pair.substr(0, eq));
    if (key == name && eq != std::string::npos) {
      std::string value = url_decode(pair.substr(eq + 1));
      // An empty value counts as absent
      if (!value.empty()) {
        return value;
      }
    }
    pos = end + 1;
  }
  return std::nullopt;
}

std::string NodeService::url_decode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());

  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

} // namespace network
} // namespace chunknode
