#ifndef CHUNKNODE_LOGGER_HPP
#define CHUNKNODE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunknode::logging {

using severity = boost::log::trivial::severity_level;

// Initialize logging with a console sink and, if log_file is non-empty,
// an auto-flushing file sink. Replaces any sinks installed earlier.
void init_logging(const std::string& log_file = "",
                  severity min_level = boost::log::trivial::info);

// Change the minimum severity that reaches the sinks
void set_log_level(severity min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_log_level(const std::string& name, severity& level);

} // namespace chunknode::logging

#endif // CHUNKNODE_LOGGER_HPP
