#ifndef CODEDROP_LOGGER_HPP
#define CODEDROP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace codedrop::logging {

struct LogConfig {
    // Empty disables the file sink
    std::string log_file;
    bool console{true};
    boost::log::trivial::severity_level min_level{boost::log::trivial::info};
    std::size_t rotation_size{10 * 1024 * 1024};  // 10 MB
};

// Replaces all sinks with a console sink and an optional rotating file sink
void init_logging(const LogConfig& config);

// Adjusts the global severity filter
void set_log_level(boost::log::trivial::severity_level level);

// Parses trace/debug/info/warning/error/fatal, throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace codedrop::logging

#endif // CODEDROP_LOGGER_HPP
