#ifndef HOLD_LOGGER_HPP
#define HOLD_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace hold::logging {

using severity_level = boost::log::trivial::severity_level;

// Routes all records to a text file, replacing any existing sinks
void init_logging(const std::string& log_file = "hold.log",
                  severity_level min_level = boost::log::trivial::info);

// Routes all records to std::clog, replacing any existing sinks
void init_console_logging(severity_level min_level = boost::log::trivial::warning);

// Changes the minimum severity without touching the sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else
severity_level parse_severity(const std::string& name);

} // namespace hold::logging

#endif // HOLD_LOGGER_HPP
