#include <filesystem>
#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "cli/console_bridge.hpp"
#include "cli/options.hpp"
#include "logger/logger.hpp"
#include "transfer/transfer_engine.hpp"

bool run_engine(const codedrop::cli::ProgramOptions& options) {
  try {
    codedrop::logging::LogConfig log_config;
    log_config.log_file = options.log_file;
    // The console belongs to the shell unless debugging
    log_config.console = options.verbose;
    log_config.min_level = options.verbose ? boost::log::trivial::debug : boost::log::trivial::info;
    if (options.log_level) {
      log_config.min_level = *options.log_level;
    }
    codedrop::logging::init_logging(log_config);

    std::filesystem::path download_dir(options.download_dir);
    if (!std::filesystem::is_directory(download_dir)) {
      std::cerr << "Error: Download directory does not exist: " << download_dir.string() << '\n';
      return false;
    }

    codedrop::transfer::EngineConfig config;
    config.bind_address = options.address;
    config.port = options.port;

    codedrop::cli::ConsoleBridge bridge;
    codedrop::transfer::TransferEngine engine(config, {bridge, bridge, bridge, bridge});
    codedrop::cli::CLI cli(engine, bridge, download_dir);

    if (!engine.start()) {
      std::cerr << "Error: Failed to start listener\n";
      return false;
    }

    cli.run();
    engine.stop();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start engine: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = codedrop::cli::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    codedrop::cli::print_usage(std::cout, argv[0]);
    return 0;
  }
  return run_engine(options) ? 0 : 1;
}
