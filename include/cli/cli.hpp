#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "store/drop_store.hpp"
#include "logger/logger.hpp"

namespace dr {
namespace cli {

enum class Command {
  Drop,
  List,
  Recover,
  Delete,
  Help
};

struct ProgramOptions {
  Command command = Command::Drop;
  std::vector<std::string> targets;
  store::Selection selection = store::Selection::Unique;
  // Empty selects the default store directory
  std::string store_path;
  logging::LogConfig log_config;
  bool valid = false;
  std::string error;
};

// Returns the value of an environment variable, if set
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// Parses arguments (without the program name). Command-line options win
// over DR_STORE, DR_LOG_FILE and DR_LOG_LEVEL from the environment.
ProgramOptions parse_command_line(const std::vector<std::string>& args,
                                  const EnvironmentLookup& environment);

// Reads the process environment
std::optional<std::string> process_environment(const std::string& name);

void print_usage(std::ostream& out);

class CLI {
public:
  static constexpr int EXIT_OK = 0;
  static constexpr int EXIT_ITEM_FAILED = 1;
  static constexpr int EXIT_USAGE = 2;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(store::DropStore& store, std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Executes one command; every target is attempted even after a failure
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  store::DropStore& store_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  int handle_drop_command(const std::vector<std::string>& paths);
  int handle_recover_command(const std::vector<std::string>& identifiers, store::Selection selection);
  int handle_delete_command(const std::vector<std::string>& identifiers, store::Selection selection);
  int handle_list_command();
  void report_ambiguous(const store::AmbiguousMatchError& error);
  void log_and_display_error(const std::string& message, const std::string& error);
};

// Local "YYYY-mm-dd HH:MM:SS" for an epoch timestamp
std::string format_timestamp(std::int64_t timestamp);

} // namespace cli
} // namespace dr
