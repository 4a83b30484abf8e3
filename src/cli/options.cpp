#include "cli/options.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include "logger/logger.hpp"

namespace codedrop {
namespace cli {

namespace {

enum class Flag {
  ADDRESS,
  PORT,
  DIR,
  LOG_FILE,
  LOG_LEVEL,
  VERBOSE,
  HELP
};

bool takes_value(Flag flag) {
  return flag != Flag::VERBOSE && flag != Flag::HELP;
}

bool parse_port(const std::string& value, uint16_t& port) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > 65535) {
      return false;
    }
    port = static_cast<uint16_t>(parsed);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

} // namespace

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -a, --address   Listen address (default 0.0.0.0)\n"
      << "  -p, --port      Listen port (default " << transfer::DEFAULT_PORT << ")\n"
      << "  -d, --dir       Default download directory (default .)\n"
      << "  -l, --log-file  Also write logs to this file\n"
      << "      --log-level trace|debug|info|warning|error|fatal\n"
      << "  -v, --verbose   Log debug messages\n"
      << "      --help      Show this message\n"
      << "Example: " << program_name << " -p 10001 -d ~/Downloads\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-a", Flag::ADDRESS},
    {"--address", Flag::ADDRESS},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"-d", Flag::DIR},
    {"--dir", Flag::DIR},
    {"-l", Flag::LOG_FILE},
    {"--log-file", Flag::LOG_FILE},
    {"--log-level", Flag::LOG_LEVEL},
    {"-v", Flag::VERBOSE},
    {"--verbose", Flag::VERBOSE},
    {"--help", Flag::HELP}
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "codedrop";

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    auto it = flag_map.find(arg);
    if (it == flag_map.end()) {
      err << "Error: Unknown argument: " << arg << '\n';
      print_usage(err, program_name);
      return options;
    }

    const Flag flag = it->second;
    std::string value;
    if (takes_value(flag)) {
      if (i + 1 >= argc) {
        err << "Error: Missing value for " << arg << '\n';
        print_usage(err, program_name);
        return options;
      }
      value = argv[++i];
    }

    switch (flag) {
      case Flag::ADDRESS:
        options.address = value;
        break;
      case Flag::PORT:
        if (!parse_port(value, options.port)) {
          err << "Error: Invalid port number: " << value << '\n';
          print_usage(err, program_name);
          return options;
        }
        break;
      case Flag::DIR:
        options.download_dir = value;
        break;
      case Flag::LOG_FILE:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        try {
          options.log_level = logging::parse_severity(value);
        } catch (const std::invalid_argument& e) {
          err << "Error: " << e.what() << '\n';
          print_usage(err, program_name);
          return options;
        }
        break;
      case Flag::VERBOSE:
        options.verbose = true;
        break;
      case Flag::HELP:
        options.show_help = true;
        break;
    }
  }

  if (options.address.empty()) {
    err << "Error: Listen address must not be empty\n";
    print_usage(err, program_name);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace codedrop
