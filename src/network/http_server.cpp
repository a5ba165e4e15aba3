#include "network/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace chunknode {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// Reads one request, writes one response, then closes
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, NodeService& service, const HttpServerOptions& options)
    : stream_(std::move(socket))
    , service_(service)
    , options_(options) {}

  void run() {
    boost::asio::dispatch(stream_.get_executor(),
      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
  }

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<HttpResponse> response_;
  NodeService& service_;
  const HttpServerOptions& options_;

  void do_read() {
    parser_.emplace();
    parser_->body_limit(options_.max_body_bytes);
    stream_.expires_after(options_.request_timeout);

    http::async_read(stream_, buffer_, *parser_,
      beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == http::error::end_of_stream) {
      return do_close();
    }

    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Request body exceeds " << options_.max_body_bytes << " bytes";
      HttpResponse response{http::status::payload_too_large, parser_->get().version()};
      response.set(http::field::content_type, "application/json");
      response.keep_alive(false);
      response.body() = "{\"success\":false,\"error\":\"Request body too large\"}";
      response.prepare_payload();
      return send(std::move(response));
    }

    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read failed: " << ec.message();
      return do_close();
    }

    BOOST_LOG_TRIVIAL(trace) << "HTTP server: Read request of " << bytes_transferred << " bytes";
    send(service_.handle(parser_->release()));
  }

  void send(HttpResponse&& response) {
    // Keep the response alive until the write completes
    response_ = std::make_shared<HttpResponse>(std::move(response));
    stream_.expires_after(options_.request_timeout);

    http::async_write(stream_, *response_,
      beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write failed: " << ec.message();
    } else {
      BOOST_LOG_TRIVIAL(trace) << "HTTP server: Wrote response of " << bytes_transferred << " bytes";
    }
    do_close();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, NodeService& service,
                       const HttpServerOptions& options)
  : address_(address)
  , port_(port)
  , bound_port_(0)
  , options_(options)
  , is_running_(false)
  , service_(service) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    // Fresh io_context state in case of a restart after shutdown
    io_context_.restart();

    // Accept handlers and the close in shutdown() share the acceptor's strand
    acceptor_ = std::make_unique<tcp::acceptor>(boost::asio::make_strand(io_context_));
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    std::size_t threads = options_.worker_threads > 0 ? options_.worker_threads : 1;
    for (std::size_t i = 0; i < threads; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_.run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on " << address_ << ":" << bound_port_
                            << " with " << threads << " worker threads";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own strand
  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!error) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection";
        std::make_shared<HttpSession>(std::move(socket), service_, options_)->run();
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  boost::asio::post(acceptor_->get_executor(), [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
      }
    }
  });

  // Let in-flight sessions run to completion, then the threads return
  work_guard_.reset();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

} // namespace network
} // namespace chunknode
