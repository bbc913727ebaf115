// mathedit - command-line host for the formula engine
//
// Usage:
//   mathedit check [file|-]       Validate markup and report diagnostics
//   mathedit format [file|-]      Print canonical markup
//   mathedit dump [file|-]        Print the expression tree
//   mathedit json [file|-]        Print the expression tree as JSON
//   mathedit templates            Validate the configured toolbar templates
//
#include <fmt/core.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "mathedit/basic/diagnostic_printer.hpp"
#include "mathedit/config/engine_config.hpp"
#include "mathedit/edit/placeholder_manager.hpp"
#include "mathedit/edit/template_library.hpp"
#include "mathedit/syntax/frontend.hpp"
#include "mathedit/syntax/serializer.hpp"
#include "mathedit/tree/json_visitor.hpp"
#include "mathedit/tree/tree_dumper.hpp"
#include "mathedit/tree/tree_ops.hpp"
#include "mathedit/validate/validator.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_rejected = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "mathedit v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options] [file|-]\n\n"
            << "Commands:\n"
            << "  check       Validate markup and report diagnostics\n"
            << "  format      Print canonical markup\n"
            << "  dump        Print the expression tree\n"
            << "  json        Print the expression tree as JSON\n"
            << "  templates   Validate the configured toolbar templates\n\n"
            << "Options:\n"
            << "  --config <path>       Use this mathedit.yaml instead of searching for one\n"
            << "  --max-length <n>      Override limits.max_length\n"
            << "  --max-depth <n>       Override limits.max_nesting_depth\n"
            << "  --no-color            Disable colored diagnostics\n"
            << "  -v, --verbose         Verbose output\n"
            << "  -h, --help            Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  std::optional<uint32_t> max_length;
  std::optional<uint32_t> max_depth;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<uint32_t> parse_count(const std::string & text)
{
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  const unsigned long value = std::strtoul(text.c_str(), nullptr, 10);
  if (value == 0 || value > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

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

    if (arg == "--config" || arg == "--max-length" || arg == "--max-depth") {
      if (i + 1 >= argc) {
        args.error = fmt::format("option '{}' requires a value", arg);
        return args;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        args.config_path = value;
        continue;
      }
      const auto count = parse_count(value);
      if (!count) {
        args.error = fmt::format("option '{}' expects a positive integer, got '{}'", arg, value);
        return args;
      }
      (arg == "--max-length" ? args.max_length : args.max_depth) = count;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if ((arg == "-" || arg[0] != '-') && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = fmt::format("unexpected argument '{}'", arg);
      return args;
    }
  }

  return args;
}

// ============================================================================
// Setup
// ============================================================================

std::optional<mathedit::EngineConfig> resolve_config(const CommandArgs & args)
{
  mathedit::EngineConfig config;

  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
  } else {
    path = mathedit::find_engine_config(fs::current_path());
  }

  if (path) {
    const auto loaded = mathedit::load_engine_config(*path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = loaded.config;
    if (args.verbose) {
      fmt::print(stderr, "Using configuration: {}\n", path->string());
    }
  } else if (args.verbose) {
    fmt::print(stderr, "No {} found; using built-in defaults\n", mathedit::k_engine_config_file_name);
  }

  if (args.max_length) {
    config.limits.max_length = *args.max_length;
  }
  if (args.max_depth) {
    config.limits.max_nesting_depth = *args.max_depth;
  }
  return config;
}

/// Markup from a file or stdin; one trailing line break is not part of the formula
std::optional<mathedit::SourceManager> read_input(const CommandArgs & args)
{
  std::string text;
  std::string name;
  if (args.input_file.empty() || args.input_file == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    name = "<stdin>";
  } else {
    std::ifstream file(args.input_file, std::ios::binary);
    if (!file.is_open()) {
      std::cerr << "error: failed to open file: " << args.input_file << "\n";
      return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    text = buffer.str();
    name = args.input_file;
  }

  if (!text.empty() && text.back() == '\n') {
    text.pop_back();
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
  }
  return mathedit::SourceManager(std::move(name), std::move(text));
}

bool use_color(const CommandArgs & args) { return !args.no_color && isatty(fileno(stderr)) != 0; }

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args, const mathedit::Validator & validator)
{
  const auto source = read_input(args);
  if (!source) {
    return k_exit_usage;
  }

  const auto errors = validator.inspect(source->get_source());
  if (errors.empty()) {
    std::cout << source->get_name() << ": OK\n";
    return k_exit_ok;
  }

  mathedit::DiagnosticPrinter printer(std::cerr, use_color(args));
  for (const auto & error : errors) {
    printer.print(mathedit::to_diagnostic(error), *source);
  }
  return k_exit_rejected;
}

int cmd_format(const CommandArgs & args, const mathedit::Validator & validator)
{
  const auto source = read_input(args);
  if (!source) {
    return k_exit_usage;
  }

  const auto checked = validator.validate(source->get_source());
  if (!checked) {
    mathedit::DiagnosticPrinter printer(std::cerr, use_color(args));
    for (const auto & error : checked.error()) {
      printer.print(mathedit::to_diagnostic(error), *source);
    }
    return k_exit_rejected;
  }

  mathedit::ExprContext ctx;
  const auto parsed = mathedit::parse_markup(ctx, *checked);
  std::cout << mathedit::serialize(parsed.root) << "\n";
  return k_exit_ok;
}

/// Shared by dump and json: the tree is printed even when parsing reported errors
int cmd_tree(const CommandArgs & args, const mathedit::Validator & validator, bool as_json)
{
  const auto source = read_input(args);
  if (!source) {
    return k_exit_usage;
  }

  if (const auto too_long = validator.check_length(source->get_source())) {
    mathedit::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print(mathedit::to_diagnostic(*too_long), *source);
    return k_exit_rejected;
  }

  mathedit::ExprContext ctx;
  const auto parsed = mathedit::parse_markup(ctx, source->get_source());

  if (!parsed.diagnostics.empty()) {
    mathedit::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print_all(parsed.diagnostics, *source);
  }

  if (as_json) {
    std::cout << mathedit::to_json(parsed.root).dump(2) << "\n";
  } else {
    mathedit::TreeDumper(std::cout).dump(parsed.root);
  }

  if (args.verbose) {
    fmt::print(
      stderr, "{} nodes, depth {}, {} placeholders\n", mathedit::count_nodes(parsed.root),
      mathedit::structural_depth(parsed.root),
      mathedit::enumerate_placeholders(parsed.root).size());
  }
  return parsed.ok() ? k_exit_ok : k_exit_rejected;
}

int cmd_templates(
  const CommandArgs & args, const mathedit::EngineConfig & config,
  const mathedit::Validator & validator)
{
  const auto entries = config.templates.empty() ? mathedit::TemplateLibrary::builtin_templates()
                                                : config.templates;
  if (args.verbose) {
    fmt::print(
      stderr, "Checking {} {} templates\n", entries.size(),
      config.templates.empty() ? "built-in" : "configured");
  }

  mathedit::TemplateLibrary library;
  const auto rejected = library.load(entries, validator);

  for (const auto & tpl : library.templates()) {
    std::cout << fmt::format(
      "{}: {} ({} placeholder{})\n", tpl.name, tpl.markup, tpl.placeholder_count,
      tpl.placeholder_count == 1 ? "" : "s");
  }

  if (!rejected.empty()) {
    mathedit::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print_all(rejected, mathedit::SourceManager("<templates>", ""));
    return k_exit_rejected;
  }
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

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return k_exit_usage;
  }

  const auto config = resolve_config(args);
  if (!config) {
    return k_exit_usage;
  }
  const mathedit::Validator validator(config->limits, config->commands);

  if (args.command == "check") {
    return cmd_check(args, validator);
  }

  if (args.command == "format") {
    return cmd_format(args, validator);
  }

  if (args.command == "dump") {
    return cmd_tree(args, validator, false);
  }

  if (args.command == "json") {
    return cmd_tree(args, validator, true);
  }

  if (args.command == "templates") {
    return cmd_templates(args, *config, validator);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
