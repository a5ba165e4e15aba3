#include "config/node_config.hpp"
#include "logger/logger.hpp"
#include "node/storage_node.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

bool run_node(const chunknode::config::NodeConfig& config) {
  try {
    chunknode::node::StorageNode node(config);

    if (!node.start()) {
      std::cerr << "Error: Failed to start storage node\n";
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Shutdown signal " << signal_number << " received";
      }
    });
    signal_context.run();

    return node.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run storage node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  chunknode::config::NodeConfig config;
  try {
    config = chunknode::config::parse_command_line(argc, argv);
  } catch (const chunknode::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    chunknode::config::print_usage(std::cerr, argv[0]);
    return 1;
  }

  if (config.show_help) {
    chunknode::config::print_usage(std::cout, argv[0]);
    return 0;
  }

  try {
    chunknode::logging::init_logging(config.log_file, config.log_level);
  } catch (const std::exception&) {
    // init_logging has already reported the cause
    return 1;
  }

  return run_node(config) ? 0 : 1;
}
