#ifndef DBRIDGE_LOGGER_HPP
#define DBRIDGE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace dbridge::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Unknown names fall back to info.
severity_level severity_from_string(const std::string& name);

// Replaces all sinks with a synchronous text file sink
void init_logging(const std::string& log_file = "decora_bridge.log",
                  severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);

} // namespace dbridge::logging

#endif // DBRIDGE_LOGGER_HPP
