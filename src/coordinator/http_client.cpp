#include "coordinator/http_client.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include <json/reader.h>
#include <json/writer.h>
#include <memory>
#include <optional>

namespace chunknode::coordinator {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

const char* const USER_AGENT = "chunknode";

// Async resolve -> connect -> write -> read chain driven by a private io_context
class Exchange {
public:
  Exchange(boost::asio::io_context& io_context, const Url& url, http::request<http::string_body>&& request,
           std::chrono::milliseconds timeout)
    : resolver_(io_context)
    , stream_(io_context)
    , url_(url)
    , request_(std::move(request))
    , timeout_(timeout) {}

  void start() {
    resolver_.async_resolve(url_.host, url_.port,
      [this](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        stream_.expires_after(timeout_);
        stream_.async_connect(results,
          [this](beast::error_code ec, const tcp::endpoint&) {
            if (ec) return fail(ec, "connect");
            stream_.expires_after(timeout_);
            http::async_write(stream_, request_,
              [this](beast::error_code ec, std::size_t) {
                if (ec) return fail(ec, "write");
                stream_.expires_after(timeout_);
                http::async_read(stream_, buffer_, response_,
                  [this](beast::error_code ec, std::size_t) {
                    if (ec) return fail(ec, "read");
                    beast::error_code ignored;
                    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
                    done_ = true;
                  });
              });
          });
      });
  }

  bool done() const { return done_; }
  const std::optional<std::string>& error() const { return error_; }
  const http::response<http::string_body>& response() const { return response_; }

private:
  tcp::resolver resolver_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  Url url_;
  http::request<http::string_body> request_;
  http::response<http::string_body> response_;
  std::chrono::milliseconds timeout_;
  bool done_{false};
  std::optional<std::string> error_;

  void fail(beast::error_code ec, const char* stage) {
    error_ = std::string(stage) + " failed: " + ec.message();
  }
};

} // namespace

//==============================================
// URL PARSING
//==============================================

Url Url::parse(const std::string& url) {
  const std::string scheme_sep = "://";
  std::size_t scheme_end = url.find(scheme_sep);
  if (scheme_end == std::string::npos) {
    throw CoordinatorError("Invalid URL: " + url);
  }

  std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http") {
    throw CoordinatorError("Unsupported URL scheme '" + scheme + "' in " + url);
  }

  std::string rest = url.substr(scheme_end + scheme_sep.size());
  std::size_t path_start = rest.find('/');
  std::string authority = rest.substr(0, path_start);

  Url parsed;
  parsed.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

  std::size_t colon = authority.rfind(':');
  if (colon == std::string::npos) {
    parsed.host = authority;
    parsed.port = "80";
  } else {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  }

  if (parsed.host.empty() || parsed.port.empty() ||
      parsed.port.find_first_not_of("0123456789") != std::string::npos) {
    throw CoordinatorError("Invalid URL: " + url);
  }
  return parsed;
}


//==============================================
// REQUEST EXECUTION
//==============================================

Json::Value HttpClient::post_json(const std::string& url, const Json::Value& body,
                                  std::chrono::milliseconds timeout) {
  Url parsed = Url::parse(url);

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";

  http::request<http::string_body> request{http::verb::post, parsed.target, 11};
  request.set(http::field::host, parsed.host + ":" + parsed.port);
  request.set(http::field::user_agent, USER_AGENT);
  request.set(http::field::content_type, "application/json");
  request.keep_alive(false);
  request.body() = Json::writeString(writer, body);
  request.prepare_payload();

  BOOST_LOG_TRIVIAL(debug) << "HTTP client: POST " << url << " (" << request.body().size() << " bytes)";

  boost::asio::io_context io_context;
  Exchange exchange(io_context, parsed, std::move(request), timeout);
  exchange.start();

  // Bounds the resolve step too, which the stream timer does not cover
  io_context.run_for(timeout);
  if (!io_context.stopped()) {
    io_context.stop();
  }

  if (exchange.error()) {
    throw CoordinatorUnreachable(*exchange.error());
  }
  if (!exchange.done()) {
    throw CoordinatorUnreachable("timed out after " + std::to_string(timeout.count()) + " ms");
  }

  const auto& response = exchange.response();
  unsigned status = response.result_int();
  if (status < 200 || status >= 300) {
    throw CoordinatorRejected("HTTP " + std::to_string(status) + " from " + url);
  }

  // Response bodies are informational; anything not JSON reads as null
  Json::Value result;
  Json::CharReaderBuilder reader_builder;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  std::string errors;
  const std::string& text = response.body();
  if (!text.empty() && !reader->parse(text.data(), text.data() + text.size(), &result, &errors)) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Non-JSON response from " << url << ": " << errors;
    result = Json::Value();
  }
  return result;
}

} // namespace chunknode::coordinator
