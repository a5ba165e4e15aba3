#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace chunknode::logging {

namespace expr = boost::log::expressions;

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const std::string& log_file, severity min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    auto formatter = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;

    auto console_sink = boost::log::add_console_log(std::clog);
    console_sink->set_formatter(formatter);

    if (!log_file.empty()) {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      // Append across restarts
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto file_sink = boost::make_shared<text_sink>(backend);
      file_sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(file_sink);
    }

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (log_file.empty() ? "" : " with file: " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

  
//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(severity min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

bool parse_log_level(const std::string& name, severity& level) {
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace chunknode::logging
