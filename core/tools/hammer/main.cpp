// hammer - Nix package set linter command line interface
//
// Usage:
//   hammer [options] <attr>...
//
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "hammer/basic/error.hpp"
#include "hammer/basic/trace.hpp"
#include "hammer/check/external_checks.hpp"
#include "hammer/driver/overlay_finder.hpp"
#include "hammer/driver/session.hpp"
#include "hammer/eval/evaluator.hpp"
#include "hammer/project/hammer_config.hpp"
#include "hammer/report/report_printer.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_fatal = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "hammer v0.1.0\n\n"
            << "Usage: " << program_name << " [options] <attr>...\n\n"
            << "Options:\n"
            << "  -f, --file <path>        Package set to import (default: current directory)\n"
            << "  -e, --exclude <rule>     Exclude a rule (overlay, check or built-in); repeatable\n"
            << "  --json                   Emit JSON instead of annotated text\n"
            << "  --show-trace             Pass --show-trace to the evaluator\n"
            << "  -v, --verbose            Verbose output\n"
            << "  --no-color               Never color terminal output\n"
            << "  --overlays <dir>         Directory of rule overlays (*.nix)\n"
            << "  --checks <a:b:c>         External checks (overrides AST_CHECK_NAMES)\n"
            << "  --check-path <dir>       Extra directory searched for checks; repeatable\n"
            << "  --jobs <n>               Maximum number of concurrent checks\n"
            << "  --timeout <seconds>      Per-check timeout (0 = none)\n"
            << "  --evaluator <cmd>        Evaluator executable (default: nix-instantiate)\n"
            << "  --config <path>          Configuration file (default: nearest hammer.yaml)\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::vector<std::string> attributes;
  std::optional<std::string> file;
  std::vector<std::string> excluded;
  std::optional<std::string> overlays;
  std::optional<std::string> checks;
  std::vector<std::string> check_paths;
  std::optional<unsigned> jobs;
  std::optional<unsigned> timeout;
  std::optional<std::string> evaluator;
  std::optional<std::string> config;
  bool json = false;
  bool show_trace = false;
  bool verbose = false;
  bool no_color = false;
  bool show_help = false;

  /// Set when the command line is malformed
  std::string usage_error;
};

std::optional<unsigned> parse_unsigned(const std::string & text)
{
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    const unsigned long value = std::stoul(text);
    if (value > 0xFFFFFFFFUL) {
      return std::nullopt;
    }
    return static_cast<unsigned>(value);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-') {
      args.attributes.push_back(arg);
      continue;
    }

    if (arg == "--") {
      options_done = true;
      continue;
    }

    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
      continue;
    }
    if (arg == "--json") {
      args.json = true;
      continue;
    }
    if (arg == "--show-trace") {
      args.show_trace = true;
      continue;
    }
    if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
      continue;
    }
    if (arg == "--no-color") {
      args.no_color = true;
      continue;
    }

    // Everything below takes a value
    if (i + 1 >= argc) {
      args.usage_error = "option '" + arg + "' requires a value";
      return args;
    }
    const std::string value = argv[++i];

    if (arg == "-f" || arg == "--file") {
      args.file = value;
    } else if (arg == "-e" || arg == "--exclude") {
      args.excluded.push_back(value);
    } else if (arg == "--overlays") {
      args.overlays = value;
    } else if (arg == "--checks") {
      args.checks = value;
    } else if (arg == "--check-path") {
      args.check_paths.push_back(value);
    } else if (arg == "--evaluator") {
      args.evaluator = value;
    } else if (arg == "--config") {
      args.config = value;
    } else if (arg == "--jobs" || arg == "--timeout") {
      const auto number = parse_unsigned(value);
      if (!number) {
        args.usage_error = "option '" + arg + "' expects a non-negative integer, got '" + value + "'";
        return args;
      }
      (arg == "--jobs" ? args.jobs : args.timeout) = *number;
    } else {
      args.usage_error = "unknown option '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Load the explicit or nearest hammer.yaml; an absent file yields defaults.
hammer::ConfigLoadResult load_config(const CommandArgs & args)
{
  if (args.config) {
    return hammer::load_hammer_config(fs::absolute(*args.config));
  }

  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (!ec) {
    if (const auto found = hammer::find_hammer_config(cwd)) {
      return hammer::load_hammer_config(*found);
    }
  }
  return hammer::ConfigLoadResult::ok(hammer::HammerConfig{});
}

/// Combine configuration file, environment and flags into session options.
hammer::SessionOptions make_session_options(
  const CommandArgs & args, const hammer::HammerConfig & config)
{
  hammer::SessionOptions options;
  options.attributes = args.attributes;

  if (args.file) {
    options.package_set = *args.file;
  } else if (config.nixpkgs) {
    options.package_set = *config.nixpkgs;
  }

  if (args.overlays) {
    options.overlay_dir = fs::path(*args.overlays);
  } else if (config.overlays) {
    options.overlay_dir = *config.overlays;
  } else {
    options.overlay_dir = hammer::find_overlay_dir();
  }

  options.excluded.insert(config.exclude.begin(), config.exclude.end());
  options.excluded.insert(args.excluded.begin(), args.excluded.end());

  hammer::CheckConfig & checks = options.checks;
  if (args.checks) {
    checks.checks = hammer::parse_check_list(*args.checks);
  } else if (const char * env = std::getenv("AST_CHECK_NAMES")) {
    checks.checks = hammer::parse_check_list(env);
  } else {
    checks.checks = config.checks.names;
  }

  checks.search_dirs = config.checks.path;
  for (const auto & dir : args.check_paths) {
    checks.search_dirs.push_back(fs::absolute(dir));
  }

  checks.jobs = args.jobs.value_or(config.checks.jobs.value_or(0));
  checks.timeout = std::chrono::seconds(args.timeout.value_or(config.checks.timeout.value_or(0)));

  return options;
}

// ============================================================================
// Command
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const auto config_result = load_config(args);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return k_exit_fatal;
  }
  const hammer::HammerConfig & config = config_result.config;

  hammer::Trace trace(std::cerr, args.verbose);
  if (!config.project_root.empty()) {
    trace.log("using configuration from {}", config.project_root.string());
  }

  hammer::NixEvaluatorOptions eval_options;
  if (args.evaluator) {
    eval_options.command = *args.evaluator;
  } else if (config.evaluator) {
    eval_options.command = *config.evaluator;
  }
  eval_options.show_trace = args.show_trace;
  hammer::NixInstantiateEvaluator evaluator(eval_options, trace);

  // Render into a buffer so that a failed run writes nothing to stdout
  std::ostringstream out;
  try {
    hammer::Session session(make_session_options(args, config), evaluator, trace);
    const hammer::SessionResult result = session.run();

    if (args.json) {
      hammer::print_json(out, result.bundle);
    } else {
      const bool use_color = !args.no_color && isatty(fileno(stdout)) != 0;
      hammer::ReportPrinter printer(out, use_color);
      printer.print_all(result.bundle);
    }
  } catch (const hammer::PluginError & e) {
    std::cerr << "error: " << e.what() << "\n"
              << "input:\n"
              << e.input() << "\n";
    return k_exit_fatal;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_fatal;
  }

  std::cout << out.str() << std::flush;
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.attributes.empty()) {
    std::cerr << "error: no attribute given\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  return cmd_check(args);
}
