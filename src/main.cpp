#include "cli/cli.hpp"
#include "config/storage_layout.hpp"
#include "logger/logger.hpp"
#include "storage/storage.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string base_dir;
  std::string log_file{"tutor_store.log"};
  tutor::logging::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -b <base_dir> [-l <log_file>] [-v <log_level>]\n"
        << "Required arguments:\n"
        << "  -b, --base       Storage base directory\n"
        << "Optional arguments:\n"
        << "  -l, --log-file   Log file (default: tutor_store.log)\n"
        << "  -v, --log-level  trace, debug, info, warning, error or fatal (default: info)\n"
        << "Example: " << program_name << " -b /srv/tutor -v debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-b", "--base", "-l", "--log-file", "-v", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-b" || flag == "--base") {
      options.base_dir = value;
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      auto level = tutor::logging::parse_log_level(value);
      if (!level) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.log_level = *level;
    }
  }

  if (options.base_dir.empty()) {
    std::cerr << "Error: The base directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    tutor::logging::init_logging(options.log_file, options.log_level);

    tutor::Storage storage(tutor::config::StorageLayout::from_base(options.base_dir));
    tutor::cli::CLI cli(storage);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start storage shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
