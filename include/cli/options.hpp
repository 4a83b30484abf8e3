#ifndef CODEDROP_CLI_OPTIONS_HPP
#define CODEDROP_CLI_OPTIONS_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <boost/log/trivial.hpp>
#include "transfer/engine_config.hpp"

namespace codedrop {
namespace cli {

struct ProgramOptions {
  std::string address{"0.0.0.0"};
  uint16_t port{transfer::DEFAULT_PORT};
  std::string download_dir{"."};
  std::string log_file;
  bool verbose{false};
  // Overrides the level chosen by verbose
  std::optional<boost::log::trivial::severity_level> log_level;
  bool show_help{false};
  bool valid{false};
};

void print_usage(std::ostream& out, const std::string& program_name);

// Unknown flags, missing values, bad ports and bad log levels leave valid == false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace cli
} // namespace codedrop

#endif // CODEDROP_CLI_OPTIONS_HPP
