// ngc - nested geometry tally unit renderer
//
// Usage:
//   ngc render <file.yaml> [--format card|comment|wire|json] [-o output]
//   ngc check <file.yaml>
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "nestgeom/basic/diagnostic.hpp"
#include "nestgeom/basic/diagnostic_printer.hpp"
#include "nestgeom/basic/error.hpp"
#include "nestgeom/project/tally_config.hpp"
#include "nestgeom/render/renderer.hpp"
#include "nestgeom/unit/json_dump.hpp"
#include "nestgeom/unit/unit_context.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "nestgeom tally unit renderer v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  render <file.yaml>       Render every tally in the file\n"
            << "  check <file.yaml>        Resolve every name without writing output\n\n"
            << "Options:\n"
            << "  --format <fmt>           card (default), comment, wire or json\n"
            << "  -o, --output <path>      Write output to a file instead of stdout\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const nestgeom::DiagnosticBag & diagnostics)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  nestgeom::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class OutputFormat { Card, Comment, Wire, Json };

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string format = "card";
  bool verbose = false;
  bool show_help = false;
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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
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

bool parse_format(const std::string & name, OutputFormat & out)
{
  if (name == "card") {
    out = OutputFormat::Card;
  } else if (name == "comment") {
    out = OutputFormat::Comment;
  } else if (name == "wire") {
    out = OutputFormat::Wire;
  } else if (name == "json") {
    out = OutputFormat::Json;
  } else {
    return false;
  }
  return true;
}

/// Load the input file, reporting failures. Returns false on error.
bool load_input(
  const CommandArgs & args, nestgeom::UnitContext & ctx, nestgeom::TallyDocument & doc)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: ngc " << args.command << " <file.yaml>\n";
    return false;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    fmt::print(stderr, "Loading: {}\n", input_path.string());
  }

  nestgeom::TallyLoadResult result = nestgeom::load_tally_file(input_path, ctx);
  if (!result.success) {
    nestgeom::DiagnosticBag diags;
    diags.report_error(result.error).with_context(args.input_file);
    print_diagnostics(diags);
    return false;
  }

  doc = std::move(result.document);
  if (args.verbose) {
    fmt::print(stderr, "Loaded {} tallies\n", doc.tallies.size());
  }
  return true;
}

/// Render one tally in the requested form, or report why it failed.
bool render_tally(
  const nestgeom::TallyDecl & tally, const nestgeom::Registry & registry, OutputFormat format,
  std::string & out, nlohmann::json & json_out, nestgeom::DiagnosticBag & diags)
{
  try {
    switch (format) {
      case OutputFormat::Card: {
        const std::string comment = nestgeom::render_comment(tally.unit);
        const std::string wire = nestgeom::render_wire(tally.unit, registry);
        out += fmt::format("c {}: {}\n{}:{}\n", tally.name, comment, tally.name, wire);
        break;
      }
      case OutputFormat::Comment:
        out += fmt::format("{}: {}\n", tally.name, nestgeom::render_comment(tally.unit));
        break;
      case OutputFormat::Wire:
        out += fmt::format("{}:{}\n", tally.name, nestgeom::render_wire(tally.unit, registry));
        break;
      case OutputFormat::Json:
        json_out.push_back(nlohmann::json{
          {"name", tally.name},
          {"bins", nestgeom::bin_count(tally.unit)},
          {"comment", nestgeom::render_comment(tally.unit)},
          {"wire", nestgeom::render_wire(tally.unit, registry)},
          {"unit", nestgeom::to_json(tally.unit)}});
        break;
    }
    return true;
  } catch (const nestgeom::NameNotFoundError & e) {
    diags.report(e)
      .with_context(fmt::format("tally '{}'", tally.name))
      .with_help(fmt::format(
        "add the {} to the 'system.{}' table", nestgeom::to_string(e.name_space()),
        nestgeom::table_key(e.name_space())));
  } catch (const nestgeom::NestError & e) {
    diags.report(e).with_context(fmt::format("tally '{}'", tally.name));
  }
  return false;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_render(const CommandArgs & args)
{
  OutputFormat format = OutputFormat::Card;
  if (!parse_format(args.format, format)) {
    std::cerr << "error: unknown format '" << args.format << "'\n";
    return 1;
  }

  nestgeom::UnitContext ctx;
  nestgeom::TallyDocument doc;
  if (!load_input(args, ctx, doc)) {
    return 1;
  }

  std::string text;
  nlohmann::json json_out = nlohmann::json::array();
  nestgeom::DiagnosticBag diags;

  for (const auto & tally : doc.tallies) {
    if (args.verbose) {
      fmt::print(stderr, "Rendering: {}\n", tally.name);
    }
    (void)render_tally(tally, doc.registry, format, text, json_out, diags);
  }

  if (!diags.empty()) {
    print_diagnostics(diags);
  }
  if (diags.has_errors()) {
    return 1;
  }

  if (format == OutputFormat::Json) {
    text = json_out.dump(2) + "\n";
  }

  if (args.output_path.empty()) {
    std::cout << text;
    return 0;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << text;
  std::cerr << "Rendered " << doc.tallies.size() << " tallies to " << args.output_path << "\n";
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  nestgeom::UnitContext ctx;
  nestgeom::TallyDocument doc;
  if (!load_input(args, ctx, doc)) {
    return 1;
  }

  nestgeom::DiagnosticBag diags;
  std::string discard;
  nlohmann::json discard_json;
  for (const auto & tally : doc.tallies) {
    if (render_tally(tally, doc.registry, OutputFormat::Wire, discard, discard_json, diags) &&
        args.verbose) {
      fmt::print(stderr, "{}: {} bins\n", tally.name, nestgeom::bin_count(tally.unit));
    }
  }

  if (!diags.empty()) {
    print_diagnostics(diags);
  }
  if (diags.has_errors()) {
    return 1;
  }

  std::cout << args.input_file << ": OK\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "render") {
    return cmd_render(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
