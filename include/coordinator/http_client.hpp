#pragma once

#include <chrono>
#include <string>
#include <json/value.h>
#include "coordinator/coordinator_error.hpp"

namespace chunknode::coordinator {

// Parsed http:// URL; TLS endpoints are not supported
struct Url {
  std::string host;
  std::string port;
  std::string target;

  // Throws CoordinatorError on a malformed URL or a scheme other than http
  static Url parse(const std::string& url);
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  // POSTs body as JSON and returns the parsed response body (null if not JSON).
  // The whole exchange, resolve included, is bounded by timeout.
  // Throws CoordinatorUnreachable on network failure or timeout and
  // CoordinatorRejected on a non-2xx status.
  virtual Json::Value post_json(const std::string& url, const Json::Value& body,
                                std::chrono::milliseconds timeout);
};

} // namespace chunknode::coordinator
