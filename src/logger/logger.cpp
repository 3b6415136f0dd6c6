#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace fts::logging {

void init_logging(const LogConfig& config) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    // Remove any existing sinks to prevent duplicates
    logging::core::get()->remove_all_sinks();

    // Add common attributes
    logging::add_common_attributes();

    auto format = (
        expr::stream
            << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
            << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " [" << logging::trivial::severity << "]"
            << " " << expr::smessage
    );

    if (config.console) {
        logging::add_console_log(
            std::clog,
            keywords::format = format,
            keywords::auto_flush = true
        );
    }

    if (!config.log_file.empty()) {
        logging::add_file_log(
            keywords::file_name = config.log_file,
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = format,
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );
    }

    set_log_level(config.level);
    logging::core::get()->set_logging_enabled(true);
}

void set_log_level(boost::log::trivial::severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") { level = boost::log::trivial::trace; }
    else if (lowered == "debug") { level = boost::log::trivial::debug; }
    else if (lowered == "info") { level = boost::log::trivial::info; }
    else if (lowered == "warning" || lowered == "warn") { level = boost::log::trivial::warning; }
    else if (lowered == "error") { level = boost::log::trivial::error; }
    else if (lowered == "fatal") { level = boost::log::trivial::fatal; }
    else { return false; }
    return true;
}

} // namespace fts::logging
