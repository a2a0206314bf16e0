// vfilterc - filter expression command line interface
//
// Usage:
//   vfilterc check     <expr> | -f <file>
//   vfilterc translate <expr> | -f <file>
//   vfilterc format    <expr> | -f <file>
//   vfilterc dump      <expr> | -f <file>
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "vfilter/ast/json_visitor.hpp"
#include "vfilter/ast/sql_printer.hpp"
#include "vfilter/basic/diagnostic_printer.hpp"
#include "vfilter/config/tool_config.hpp"
#include "vfilter/filter.hpp"
#include "vfilter/qdrant/filter_json.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "vfilter expression tool v0.1.0\n\n"
            << "Usage: " << program_name << " [command] <expr> [options]\n"
            << "       " << program_name << " [command] -f <file> [options]\n\n"
            << "Commands:\n"
            << "  check        Parse and analyze, print diagnostics\n"
            << "  translate    Print the backend filter as JSON\n"
            << "  format       Print the canonical SQL-like form\n"
            << "  dump         Print the AST as JSON\n"
            << "  (omitted)    Chosen by output.format in vfilter.yaml\n\n"
            << "Options:\n"
            << "  -f, --file <path>        Read the expression from a file\n"
            << "  --config <path>          Use this vfilter.yaml instead of searching\n"
            << "  --color / --no-color     Force coloured diagnostics on or off\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const vfilter::DiagnosticBag & diagnostics, const vfilter::SourceManager & source,
  bool use_color)
{
  vfilter::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, source);
}

std::string dump_json(const nlohmann::json & j, int indent)
{
  return j.dump(indent > 0 ? indent : -1);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string expression;
  std::string input_file;
  std::string config_path;
  std::optional<bool> color;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

bool is_command(const std::string & word)
{
  return word == "check" || word == "translate" || word == "format" || word == "dump";
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  int first = 1;
  if (is_command(argv[1])) {
    args.command = argv[1];
    first = 2;
  }

  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-f" || arg == "--file") {
      if (i + 1 < argc) {
        args.input_file = argv[++i];
      } else {
        args.error = "missing path after " + arg;
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      } else {
        args.error = "missing path after --config";
      }
    } else if (arg == "--color") {
      args.color = true;
    } else if (arg == "--no-color") {
      args.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (args.expression.empty() && (arg.empty() || arg[0] != '-')) {
      args.expression = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Pipeline
// ============================================================================

struct Session
{
  vfilter::ToolConfig config;
  bool use_color = false;
  bool verbose = false;
};

std::optional<vfilter::ToolConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = vfilter::find_tool_config(fs::current_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "vfilterc: no " << vfilter::k_tool_config_file_name
                << " found, using defaults\n";
    }
    return vfilter::ToolConfig{};
  }

  const auto result = vfilter::load_tool_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "vfilterc: using configuration " << result.config.source_path.string() << "\n";
  }
  return result.config;
}

std::optional<std::string> read_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    if (args.expression.empty()) {
      std::cerr << "error: no expression given\n";
      return std::nullopt;
    }
    return args.expression;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::ifstream file(input_path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Parse and analyze; prints diagnostics. Returns nullopt on failure.
std::optional<vfilter::ParsedFilter> load_filter(const CommandArgs & args, const Session & session)
{
  const auto text = read_input(args);
  if (!text) {
    return std::nullopt;
  }

  vfilter::ParseOptions options;
  options.parser.max_depth = session.config.parser.max_depth;
  options.source_name = args.input_file.empty() ? "<expr>" : args.input_file;

  if (session.verbose) {
    std::cerr << "vfilterc: parsing " << options.source_name << " (" << text->size()
              << " bytes)\n";
  }

  auto parsed = vfilter::parse_and_analyze(*text, options);
  if (!parsed.diagnostics().empty()) {
    print_diagnostics(parsed.diagnostics(), parsed.source(), session.use_color);
  }
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return std::optional<vfilter::ParsedFilter>(std::move(parsed));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args, const Session & session)
{
  auto parsed = load_filter(args, session);
  if (!parsed) {
    return 1;
  }
  std::cout << parsed->source().get_name() << ": OK\n";
  return 0;
}

int cmd_translate(const CommandArgs & args, const Session & session)
{
  auto parsed = load_filter(args, session);
  if (!parsed) {
    return 1;
  }

  const auto result = vfilter::to_filter(parsed->root());
  if (!result.ok()) {
    vfilter::DiagnosticBag diags;
    vfilter::to_diagnostic(*result.error, diags);
    print_diagnostics(diags, parsed->source(), session.use_color);
    return 1;
  }

  if (session.verbose) {
    std::cerr << "vfilterc: " << result.filter.condition_count() << " top-level condition(s)\n";
  }
  fmt::print("{}\n", dump_json(vfilter::qdrant::to_json(result.filter), session.config.output.indent));
  return 0;
}

int cmd_format(const CommandArgs & args, const Session & session)
{
  auto parsed = load_filter(args, session);
  if (!parsed) {
    return 1;
  }
  fmt::print("{}\n", vfilter::to_sql(parsed->root()));
  return 0;
}

int cmd_dump(const CommandArgs & args, const Session & session)
{
  auto parsed = load_filter(args, session);
  if (!parsed) {
    return 1;
  }
  fmt::print("{}\n", dump_json(vfilter::to_json(parsed->root()), session.config.output.indent));
  return 0;
}

std::string command_for(vfilter::OutputFormat format)
{
  switch (format) {
    case vfilter::OutputFormat::Sql:
      return "format";
    case vfilter::OutputFormat::Ast:
      return "dump";
    case vfilter::OutputFormat::Filter:
      break;
  }
  return "translate";
}

}  // namespace

int main(int argc, char * argv[])
{
  CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  auto config = load_config(args);
  if (!config) {
    return 1;
  }

  Session session;
  session.config = std::move(*config);
  session.verbose = args.verbose;
  if (args.color) {
    session.use_color = *args.color;
  } else if (session.config.diagnostics.color != vfilter::ColorMode::Auto) {
    session.use_color = session.config.diagnostics.color == vfilter::ColorMode::Always;
  } else {
    session.use_color = isatty(fileno(stderr)) != 0;
  }

  if (args.command.empty()) {
    args.command = command_for(session.config.output.format);
    if (args.verbose) {
      std::cerr << "vfilterc: running '" << args.command << "' (output.format = "
                << vfilter::to_string(session.config.output.format) << ")\n";
    }
  }

  try {
    if (args.command == "check") {
      return cmd_check(args, session);
    }
    if (args.command == "translate") {
      return cmd_translate(args, session);
    }
    if (args.command == "format") {
      return cmd_format(args, session);
    }
    return cmd_dump(args, session);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
