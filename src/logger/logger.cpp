#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace dr::logging {

namespace {

constexpr severity_level ALL_LEVELS[] = {
    severity_level::trace,
    severity_level::debug,
    severity_level::info,
    severity_level::warning,
    severity_level::error,
    severity_level::fatal
};

} // namespace

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "trace";
        case severity_level::debug:   return "debug";
        case severity_level::info:    return "info";
        case severity_level::warning: return "warning";
        case severity_level::error:   return "error";
        case severity_level::fatal:   return "fatal";
        default:                      return "unknown";
    }
}

std::optional<severity_level> parse_severity(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (severity_level level : ALL_LEVELS) {
        if (lowered == dr::logging::to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

void init_logging(const LogConfig& config) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    auto core = logging::core::get();

    // Clear any existing sinks
    core->remove_all_sinks();

    if (!config.console && config.log_file.empty()) {
        core->set_logging_enabled(false);
        return;
    }

    logging::add_common_attributes();

    const auto format = (
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << expr::attr<logging::trivial::severity_level>("Severity") << "] "
            << expr::smessage
    );

    if (config.console) {
        logging::add_console_log(
            std::clog,
            keywords::format = format,
            keywords::auto_flush = true
        );
    }

    if (!config.log_file.empty()) {
        // Convert to absolute path so a later chdir cannot redirect the log
        std::filesystem::path log_path = std::filesystem::absolute(config.log_file);
        logging::add_file_log(
            keywords::file_name = log_path.string(),
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = format,
            keywords::auto_flush = true
        );
    }

    core->set_filter(logging::trivial::severity >= config.min_level);
    core->set_logging_enabled(true);
}

void shutdown_logging() {
    auto core = boost::log::core::get();
    core->flush();
    core->remove_all_sinks();
    core->set_logging_enabled(false);
}

} // namespace dr::logging
