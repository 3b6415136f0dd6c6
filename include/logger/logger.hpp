#ifndef FTS_LOGGER_HPP
#define FTS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fts::logging {

struct LogConfig {
    // Minimum severity that reaches any sink
    boost::log::trivial::severity_level level = boost::log::trivial::info;
    // Optional log file, rotated every 10 MB. Empty disables the file sink.
    std::string log_file;
    bool console = true;
};

// Installs the sinks described by config, replacing any existing ones
void init_logging(const LogConfig& config);

// Changes the minimum severity of an already initialized logging core
void set_log_level(boost::log::trivial::severity_level level);

// Parses trace, debug, info, warning, error or fatal (any case)
bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level);

} // namespace fts::logging

#endif // FTS_LOGGER_HPP
