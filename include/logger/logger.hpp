#ifndef DR_LOGGER_HPP
#define DR_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace dr::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
    bool console = false;       // write to std::clog
    std::string log_file;       // empty: no file sink
    severity_level min_level = severity_level::info;
};

// Convert severity level to its lowercase name ("trace" ... "fatal")
const char* to_string(severity_level level);

// Parses a level name case-insensitively; std::nullopt for unknown names
std::optional<severity_level> parse_severity(const std::string& name);

// Replaces all sinks with the configured ones. With no sink configured
// logging is disabled entirely.
void init_logging(const LogConfig& config);

// Flushes, removes all sinks and disables logging
void shutdown_logging();

} // namespace dr::logging

#endif // DR_LOGGER_HPP
