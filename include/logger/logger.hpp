#ifndef TUTOR_LOGGER_HPP
#define TUTOR_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace tutor::logging {

using severity_level = boost::log::trivial::severity_level;

// Initialize logging with a rotating file sink and, optionally, a console sink.
// Replaces any sinks installed by an earlier call.
void init_logging(const std::string& log_file = "tutor_store.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Change the minimum severity accepted by the core
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
std::optional<severity_level> parse_log_level(const std::string& name);

} // namespace tutor::logging

#endif // TUTOR_LOGGER_HPP
