#ifndef SHARDPACK_LOGGER_HPP
#define SHARDPACK_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace shardpack::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink. Every component logs through
// BOOST_LOG_TRIVIAL, so this is the single place output is configured.
void init_logging(const std::string& log_file = "shardpack.log",
                  severity_level min_level = severity_level::info);

// Installs a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

// Changes the minimum severity of the installed sinks
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

} // namespace shardpack::logging

#endif // SHARDPACK_LOGGER_HPP
