#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/clock.hpp"
#include "store/file_system.hpp"
#include "store/metadata_store.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

struct ProgramOptions {
  std::string pdf_path;
  std::string log_file{"pdfmeta.log"};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options] <file.pdf>\n"
        << "Options:\n"
        << "  -l, --log-file   Log file (default: pdfmeta.log)\n"
        << "  -v, --log-level  trace|debug|info|warning|error|fatal (default: info)\n"
        << "Example: " << program_name << " /path/to/document.pdf\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "-l" || arg == "--log-file" || arg == "-v" || arg == "--log-level") {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_usage(argv[0]);
        return options;
      }
      const std::string value(argv[++i]);
      if (arg == "-l" || arg == "--log-file") {
        options.log_file = value;
      } else {
        try {
          options.log_level = pdfmeta::logging::parse_severity(value);
        } catch (const std::invalid_argument& e) {
          std::cerr << "Error: " << e.what() << '\n';
          print_usage(argv[0]);
          return options;
        }
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(argv[0]);
      return options;
    } else if (options.pdf_path.empty()) {
      options.pdf_path = arg;
    } else {
      std::cerr << "Error: Only one PDF file may be given\n";
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.pdf_path.empty()) {
    std::cerr << "Error: A PDF file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_editor(const ProgramOptions& options) {
  try {
    pdfmeta::logging::init_logging(options.log_file, options.log_level);

    pdfmeta::store::LocalFileSystem file_system;
    pdfmeta::store::SystemClock clock;
    pdfmeta::store::MetadataStore store(file_system, clock);
    pdfmeta::cli::CLI cli(store, options.pdf_path);

    if (!isatty(STDIN_FILENO)) {
      // Nothing to prompt, show the table and leave
      cli.list_metadata();
      return true;
    }

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  if (!std::filesystem::exists(options.pdf_path)) {
    std::cerr << "Error: File not found: " << options.pdf_path << '\n';
    return 1;
  }
  return run_editor(options) ? 0 : 1;
}
