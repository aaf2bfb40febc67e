// mgraph - Module graph builder Command Line Interface
//
// Usage:
//   mgraph build [entry] [--project] [--root dir] [--json] [-v]
//   mgraph sfc <file> [--template | --style N]
//
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "modgraph/basic/diagnostic_printer.hpp"
#include "modgraph/basic/log.hpp"
#include "modgraph/driver/bundler.hpp"
#include "modgraph/driver/graph_json.hpp"
#include "modgraph/project/project_config.hpp"
#include "modgraph/sfc/sfc_compiler.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "modgraph v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [entry]            Build the module graph of a file or project\n"
            << "  sfc <file>               Print the compiled module of a composite file\n\n"
            << "Options:\n"
            << "  --project                Build every entry point of modgraph.yaml\n"
            << "  --root <dir>             Project root (default: modgraph.yaml directory or cwd)\n"
            << "  --json                   Print the graph as JSON\n"
            << "  --template               (sfc) Print the compiled template\n"
            << "  --style <N>              (sfc) Print the compiled style block N\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const modgraph::DiagnosticBag & diagnostics, const modgraph::Bundler & bundler)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  modgraph::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, bundler.sources());
}

void print_summary(const modgraph::BuildResult & result)
{
  for (const auto & module : result.modules) {
    std::cout << (module.is_external ? "  [external] " : "  ") << module.name << "\n";
  }
  if (result.entry) {
    for (const auto & header : result.entry->styles) {
      std::cout << "  [style] " << header.request << "\n";
    }
    for (const auto & path : result.entry->cyclic) {
      std::cout << "  [cycle] " << path << "\n";
    }
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string root;
  std::optional<size_t> style_index;
  bool use_project = false;
  bool json = false;
  bool template_only = false;
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
    std::string arg = argv[i];

    if (arg == "--root") {
      if (i + 1 < argc) {
        args.root = argv[++i];
      }
    } else if (arg == "--style") {
      if (i + 1 < argc) {
        const std::string value = argv[++i];
        args.style_index = modgraph::sfc::parse_style_index(value);
        if (!args.style_index) {
          args.error = "invalid style index '" + value + "'";
        }
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--template") {
      args.template_only = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

/// Project configuration from modgraph.yaml (searched upward) or defaults.
bool load_config(const CommandArgs & args, const fs::path & start, modgraph::ProjectConfig & config)
{
  if (const auto config_path = modgraph::find_project_config(start)) {
    auto loaded = modgraph::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return false;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      std::cerr << "Using project: " << config_path->string() << "\n";
    }
  } else if (args.use_project) {
    std::cerr << "error: no " << modgraph::k_project_config_file_name
              << " found in current directory or parents\n";
    return false;
  } else {
    config.project_root = fs::current_path();
  }

  if (!args.root.empty()) {
    config.build.root = fs::absolute(args.root);
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_build(const CommandArgs & args)
{
  const fs::path start =
    args.input_file.empty() ? fs::current_path() : fs::absolute(args.input_file);

  modgraph::ProjectConfig config;
  if (!load_config(args, start, config)) {
    return 1;
  }

  modgraph::Bundler bundler(std::move(config));

  std::vector<modgraph::BuildResult> results;
  if (args.use_project || args.input_file.empty()) {
    if (args.verbose) {
      std::cerr << "Building project: " << bundler.config().package.name << "\n";
    }
    results = bundler.build_project();
  } else {
    if (args.verbose) {
      std::cerr << "Building: " << start.string() << "\n";
    }
    results.push_back(bundler.build(start));
  }

  bool success = true;
  nlohmann::json out = nlohmann::json::array();
  for (const auto & result : results) {
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, bundler);
    }
    success = success && result.success;

    if (args.json) {
      out.push_back(modgraph::to_json(result));
    } else if (result.entry) {
      std::cout << result.entry->module.name << ": " << result.modules.size() << " module(s)\n";
      print_summary(result);
    }
  }

  if (args.json) {
    std::cout << modgraph::dump_json(out) << "\n";
  }

  return success ? 0 : 1;
}

int cmd_sfc(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: mgraph sfc <file> [--template | --style N]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);

  modgraph::ProjectConfig config;
  if (!load_config(args, input_path, config)) {
    return 1;
  }

  modgraph::Bundler bundler(std::move(config));
  modgraph::DiagnosticBag diags;

  std::optional<std::string> code;
  if (args.template_only) {
    code = bundler.serve_template(input_path, diags);
  } else if (args.style_index) {
    code = bundler.serve_style(input_path, *args.style_index, diags);
  } else {
    code = bundler.serve_main(input_path, diags);
  }

  if (!diags.empty()) {
    print_diagnostics(diags, bundler);
  }

  if (!code) {
    if (!diags.has_errors()) {
      std::cerr << "error: " << input_path.string() << " has no such block\n";
    }
    return 1;
  }

  std::cout << *code;
  if (!code->empty() && code->back() != '\n') {
    std::cout << "\n";
  }
  return diags.has_errors() ? 1 : 0;
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

  modgraph::log::init_logging(args.verbose ? spdlog::level::debug : spdlog::level::warn);

  if (args.command == "build") {
    return cmd_build(args);
  }

  if (args.command == "sfc") {
    return cmd_sfc(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
