#ifndef TESSERA_LOGGING_LOGGER_HPP
#define TESSERA_LOGGING_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace tessera::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a rotating text file sink, replacing any existing sinks
void init_logging(const std::string& log_file, severity_level min_level = severity_level::info);

// Installs a console sink on stderr, replacing any existing sinks
void init_console_logging(severity_level min_level = severity_level::info);

// Changes the global severity filter without touching the sinks
void set_log_level(severity_level min_level);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a level.
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

} // namespace tessera::logging

#endif // TESSERA_LOGGING_LOGGER_HPP
