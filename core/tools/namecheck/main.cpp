// namecheck - naming convention checker command line interface
//
// Usage:
//   namecheck check [decls.json | --project] [--format text|json] [--color auto|always|never]
//   namecheck init <directory>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "namecheck/basic/diagnostic_json.hpp"
#include "namecheck/basic/diagnostic_printer.hpp"
#include "namecheck/driver/driver.hpp"
#include "namecheck/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "namecheck v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [decls.json]       Check declaration names in a dump or project\n"
            << "  init <directory>         Write a starter namecheck.yaml\n\n"
            << "Options:\n"
            << "  --project                Check the inputs listed in namecheck.yaml\n"
            << "  --format <text|json>     Output format (default: text)\n"
            << "  --color <auto|always|never>\n"
            << "                           Terminal colors (default: auto)\n"
            << "  --no-source              Do not show source lines\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<namecheck::OutputFormat> format;
  std::optional<namecheck::ColorMode> color;
  bool use_project = false;
  bool no_source = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--format") {
      if (i + 1 >= argc) {
        args.error = "missing value for --format (expected 'text' or 'json')";
        break;
      }
      args.format = namecheck::parse_output_format(argv[++i]);
      if (!args.format) {
        args.error = "invalid --format value (expected 'text' or 'json')";
      }
    } else if (arg == "--color") {
      if (i + 1 >= argc) {
        args.error = "missing value for --color (expected 'auto', 'always' or 'never')";
        break;
      }
      args.color = namecheck::parse_color_mode(argv[++i]);
      if (!args.color) {
        args.error = "invalid --color value (expected 'auto', 'always' or 'never')";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-source") {
      args.no_source = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

bool resolve_color(namecheck::ColorMode mode)
{
  switch (mode) {
    case namecheck::ColorMode::Always:
      return true;
    case namecheck::ColorMode::Never:
      return false;
    case namecheck::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

void report(const namecheck::CheckResult & result, const namecheck::OutputConfig & output)
{
  if (output.format == namecheck::OutputFormat::Json) {
    std::cout << namecheck::to_json(result.diagnostics).dump(2) << "\n";
    return;
  }

  namecheck::DiagnosticPrinter printer(std::cerr, resolve_color(output.color), output.show_source);
  printer.print_all(result.diagnostics);
  printer.print_summary(result.diagnostics);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  namecheck::CheckOptions options;
  options.verbose = args.verbose;

  namecheck::OutputConfig output;
  namecheck::CheckResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find namecheck.yaml
    auto config_path = namecheck::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no namecheck.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = namecheck::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    output = config_result.config.output;
    result = namecheck::Driver::check_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking: " << input_path.string() << "\n";
    }

    result = namecheck::Driver::check_file(input_path, options);
  }

  // Command line overrides the project configuration
  if (args.format) {
    output.format = *args.format;
  }
  if (args.color) {
    output.color = *args.color;
  }
  if (args.no_source) {
    output.show_source = false;
  }

  report(result, output);

  if (args.verbose) {
    std::cerr << "Visited " << result.visited_count << " declarations in "
              << result.checked_files.size() << " file(s)\n";
  }

  // Naming warnings are advisory only
  return result.success ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: directory required\n";
    std::cerr << "usage: namecheck init <directory>\n";
    return 1;
  }

  fs::path project_dir = (fs::current_path() / args.input_file).lexically_normal();
  if (project_dir.filename().empty()) {
    project_dir = project_dir.parent_path();
  }
  const fs::path config_path = project_dir / namecheck::k_project_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: file already exists: " << config_path.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir);

    std::ofstream config(config_path);
    if (!config.is_open()) {
      std::cerr << "error: failed to create " << config_path.string() << "\n";
      return 1;
    }
    config << namecheck::starter_project_config(project_dir.filename().string());
    config.close();

    std::cout << "Wrote " << config_path.string() << "\n";
    return 0;
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
