#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace codedrop::logging {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

void init_logging(const LogConfig& config) {
    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        auto formatter = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << logging::trivial::severity << "]"
                << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
                << " " << expr::smessage
        );

        if (config.console) {
            logging::add_console_log(
                std::clog,
                keywords::format = formatter,
                keywords::auto_flush = true
            );
        }

        if (!config.log_file.empty()) {
            std::filesystem::path log_path = std::filesystem::absolute(config.log_file);
            logging::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::format = formatter,
                keywords::rotation_size = config.rotation_size,
                keywords::auto_flush = true
            );
        }

        logging::add_common_attributes();
        set_log_level(config.min_level);
        logging::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(debug) << "Logging system initialized"
                                 << (config.log_file.empty() ? "" : " with file: " + config.log_file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(logging::trivial::severity_level level) {
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

logging::trivial::severity_level parse_severity(const std::string& name) {
    logging::trivial::severity_level level;
    if (!logging::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace codedrop::logging
