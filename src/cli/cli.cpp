#include "cli/cli.hpp"
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace dr {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args,
                                  const EnvironmentLookup& environment) {
  const std::unordered_map<std::string, Command> command_flags = {
    {"-l", Command::List},
    {"--list", Command::List},
    {"-r", Command::Recover},
    {"--recover", Command::Recover},
    {"-d", Command::Delete},
    {"--delete", Command::Delete},
    {"-h", Command::Help},
    {"--help", Command::Help}
  };

  std::optional<std::string> store_path;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  const std::unordered_map<std::string, std::optional<std::string>*> value_flags = {
    {"--store", &store_path},
    {"--log-file", &log_file},
    {"--log-level", &log_level}
  };

  ProgramOptions options;
  std::optional<Command> command;
  bool verbose = false;
  bool latest = false;
  bool all = false;
  bool end_of_options = false;

  auto fail = [&options](const std::string& message) {
    options.valid = false;
    options.error = message;
    return options;
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    // "-" on its own is a path, as is everything after "--"
    if (end_of_options || arg.size() < 2 || arg.front() != '-') {
      options.targets.push_back(arg);
      continue;
    }
    if (arg == "--") {
      end_of_options = true;
      continue;
    }

    if (auto it = command_flags.find(arg); it != command_flags.end()) {
      if (command && *command != it->second) {
        return fail("Commands are mutually exclusive: " + arg);
      }
      command = it->second;
      continue;
    }

    // Value options accept both "--opt value" and "--opt=value"
    std::string flag = arg;
    std::optional<std::string> inline_value;
    if (size_t eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      flag = arg.substr(0, eq);
      inline_value = arg.substr(eq + 1);
    }
    if (auto it = value_flags.find(flag); it != value_flags.end()) {
      if (inline_value) {
        *it->second = *inline_value;
      } else if (i + 1 < args.size()) {
        *it->second = args[++i];
      } else {
        return fail("Missing value for " + flag);
      }
      continue;
    }

    if (arg == "--latest") {
      latest = true;
    } else if (arg == "--all") {
      all = true;
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      return fail("Unknown argument: " + arg);
    }
  }

  options.command = command.value_or(Command::Drop);
  if (options.command == Command::Help) {
    options.valid = true;
    return options;
  }

  if (latest && all) {
    return fail("--latest and --all cannot be combined");
  }
  if (all && options.command != Command::Delete) {
    return fail("--all is only valid with --delete");
  }
  if (latest && options.command != Command::Recover && options.command != Command::Delete) {
    return fail("--latest is only valid with --recover or --delete");
  }
  if (options.command == Command::List && !options.targets.empty()) {
    return fail("--list takes no paths");
  }
  if (options.command != Command::List && options.targets.empty()) {
    return fail("Missing filepaths");
  }

  options.selection = all ? store::Selection::All
                    : latest ? store::Selection::Latest
                    : store::Selection::Unique;

  // Fall back to the environment for anything not given on the command line
  if (!store_path) {
    store_path = environment("DR_STORE");
  }
  if (!log_file) {
    log_file = environment("DR_LOG_FILE");
  }
  if (!log_level) {
    log_level = environment("DR_LOG_LEVEL");
  }

  options.store_path = store_path.value_or("");
  options.log_config.console = verbose;
  options.log_config.log_file = log_file.value_or("");
  options.log_config.min_level = verbose ? logging::severity_level::debug
                                         : logging::severity_level::info;
  if (log_level) {
    auto level = logging::parse_severity(*log_level);
    if (!level) {
      return fail("Invalid log level: " + *log_level);
    }
    options.log_config.min_level = *level;
  }

  options.valid = true;
  return options;
}

std::optional<std::string> process_environment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void print_usage(std::ostream& out) {
  out << "dr - Drop files from the current filesystem until the next reboot, after which\n"
      << "     they are permanently deleted.\n"
      << "Usage:\n"
      << "  dr [options] <path>...           Drop paths (default)\n"
      << "  dr [options] -l, --list          List all dropped entries\n"
      << "  dr [options] -r, --recover <id>  Recover a previously dropped entry\n"
      << "  dr [options] -d, --delete <id>   Delete a dropped entry permanently\n"
      << "  dr -h, --help                    Display this help message\n"
      << "Commands are exclusive. <id> is an original path, a store name or a fragment of either.\n"
      << "Options:\n"
      << "  --latest             Choose the most recent of several matching entries\n"
      << "  --all                Delete every matching entry\n"
      << "  --store <dir>        Store directory (env DR_STORE)\n"
      << "  -v, --verbose        Log to standard error\n"
      << "  --log-file <file>    Append the log to <file> (env DR_LOG_FILE)\n"
      << "  --log-level <level>  trace, debug, info, warning, error or fatal (env DR_LOG_LEVEL)\n"
      << "  --                   Treat all remaining arguments as paths\n"
      << "Examples:\n"
      << "  dr foo.txt           drop the file\n"
      << "  dr -r foo.txt        recover the file\n"
      << "  dr -d foo.txt        delete forever\n"
      << "  dr -l                list all dropped files\n";
}

std::string format_timestamp(std::int64_t timestamp) {
  const std::time_t time = static_cast<std::time_t>(timestamp);
  const std::tm* local = std::localtime(&time);
  if (local == nullptr) {
    return std::to_string(timestamp);
  }

  std::ostringstream ss;
  ss << std::put_time(local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::DropStore& store, std::ostream& out, std::ostream& err)
  : store_(store)
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: initialized with store " << store_.root().string();
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  switch (options.command) {
    case Command::Drop:
      return handle_drop_command(options.targets);
    case Command::List:
      return handle_list_command();
    case Command::Recover:
      return handle_recover_command(options.targets, options.selection);
    case Command::Delete:
      return handle_delete_command(options.targets, options.selection);
    case Command::Help:
      print_usage(out_);
      return EXIT_OK;
  }
  return EXIT_USAGE;
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::handle_drop_command(const std::vector<std::string>& paths) {
  int status = EXIT_OK;
  for (const auto& path : paths) {
    try {
      const store::DroppedEntry entry = store_.drop_file(path);
      out_ << "Dropped: " << entry.original_path.string() << std::endl;
    } catch (const store::StoreError& e) {
      log_and_display_error("Failed to drop " + path, e.what());
      status = EXIT_ITEM_FAILED;
    }
  }
  return status;
}

int CLI::handle_recover_command(const std::vector<std::string>& identifiers,
                                store::Selection selection) {
  int status = EXIT_OK;
  for (const auto& identifier : identifiers) {
    try {
      const store::DroppedEntry entry = store_.recover_file(identifier, selection);
      out_ << "Recovered: " << entry.original_path.string() << std::endl;
    } catch (const store::AmbiguousMatchError& e) {
      report_ambiguous(e);
      status = EXIT_ITEM_FAILED;
    } catch (const store::StoreError& e) {
      log_and_display_error("Failed to recover " + identifier, e.what());
      status = EXIT_ITEM_FAILED;
    }
  }
  return status;
}

int CLI::handle_delete_command(const std::vector<std::string>& identifiers,
                               store::Selection selection) {
  int status = EXIT_OK;
  for (const auto& identifier : identifiers) {
    try {
      for (const auto& entry : store_.delete_file(identifier, selection)) {
        out_ << "Deleted: " << entry.store_name << std::endl;
      }
    } catch (const store::AmbiguousMatchError& e) {
      report_ambiguous(e);
      status = EXIT_ITEM_FAILED;
    } catch (const store::StoreError& e) {
      log_and_display_error("Failed to delete " + identifier, e.what());
      status = EXIT_ITEM_FAILED;
    }
  }
  return status;
}

int CLI::handle_list_command() {
  std::vector<store::DroppedEntry> entries;
  try {
    entries = store_.list_entries();
  } catch (const store::StoreError& e) {
    log_and_display_error("Failed to list " + store_.root().string(), e.what());
    return EXIT_ITEM_FAILED;
  }

  if (entries.empty()) {
    out_ << "Store is empty" << std::endl;
    return EXIT_OK;
  }

  for (const auto& entry : entries) {
    if (entry.recognized) {
      out_ << format_timestamp(entry.timestamp) << "  "
           << std::setw(12) << entry.size << "  "
           << entry.original_path.string() << (entry.is_directory ? "/" : "") << '\n';
    } else {
      out_ << std::left << std::setw(19) << "?" << std::right << "  "
           << std::setw(12) << entry.size << "  "
           << entry.store_name << "  (unrecognized)\n";
    }
  }
  out_ << std::flush;
  return EXIT_OK;
}

void CLI::report_ambiguous(const store::AmbiguousMatchError& error) {
  BOOST_LOG_TRIVIAL(warning) << "CLI: " << error.what();
  err_ << "dr: " << error.what() << ":\n";
  for (const auto& candidate : error.candidates()) {
    err_ << "  " << candidate.store_name;
    if (candidate.recognized) {
      err_ << "  (" << format_timestamp(candidate.timestamp) << ", "
           << candidate.original_path.string() << ")";
    } else {
      err_ << "  (unrecognized)";
    }
    err_ << '\n';
  }
  err_ << "dr: Use --latest or an exact store name to choose one" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << "dr: " << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace dr
