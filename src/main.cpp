#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/drop_store.hpp"
#include <iostream>
#include <string>
#include <vector>

int run_store_command(const dr::cli::ProgramOptions& options) {
  try {
    dr::store::StoreConfig config;
    config.root = options.store_path;
    dr::store::DropStore store(config);
    dr::cli::CLI cli(store, std::cout, std::cerr);
    return cli.run(options);
  } catch (const std::exception& e) {
    std::cerr << "dr: " << e.what() << '\n';
    return dr::cli::CLI::EXIT_USAGE;
  }
}

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto options = dr::cli::parse_command_line(args, dr::cli::process_environment);

  if (!options.valid) {
    std::cerr << "dr: " << options.error << "\n";
    dr::cli::print_usage(std::cerr);
    return dr::cli::CLI::EXIT_USAGE;
  }

  if (options.command == dr::cli::Command::Help) {
    dr::cli::print_usage(std::cout);
    return dr::cli::CLI::EXIT_OK;
  }

  try {
    dr::logging::init_logging(options.log_config);
  } catch (const std::exception& e) {
    std::cerr << "dr: Failed to initialize logging: " << e.what() << '\n';
    return dr::cli::CLI::EXIT_USAGE;
  }

  const int status = run_store_command(options);
  dr::logging::shutdown_logging();
  return status;
}
