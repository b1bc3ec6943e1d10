// apigen - Client library generator command line interface
//
// Usage:
//   apigen generate <discovery.json> [-o file.cs] [--namespace ns]
//   apigen generate --project [-o file.cs]
//   apigen init <project-name>
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "apigen/ast/ast_context.hpp"
#include "apigen/ast/ast_dumper.hpp"
#include "apigen/ast/json_visitor.hpp"
#include "apigen/basic/diagnostic_printer.hpp"
#include "apigen/codegen/csharp_generator.hpp"
#include "apigen/decorator/object_to_json.hpp"
#include "apigen/discovery/service.hpp"
#include "apigen/driver/generator.hpp"
#include "apigen/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "apigen - client library generator v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  generate [discovery.json]  Generate the service class for a discovery document\n"
    "  init <project-name>        Initialize a new project\n\n"
    "Options:\n"
    "  -o, --output <path>        Output file (default: stdout, or output_dir in project mode)\n"
    "  --project                  Generate from apigen.yaml\n"
    "  --namespace <ns>           Namespace of the generated class\n"
    "  --dump-ast                 Print the generated AST instead of C#\n"
    "  --dump-json                Print the generated AST as JSON instead of C#\n"
    "  -v, --verbose              Verbose output\n"
    "  -h, --help                 Show this help message\n",
    program_name);
}

void print_diagnostics(const apigen::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  apigen::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string ns;
  bool use_project = false;
  bool dump_ast = false;
  bool dump_json = false;
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

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      } else {
        args.error = arg + " requires a path";
      }
    } else if (arg == "--namespace") {
      if (i + 1 < argc) {
        args.ns = argv[++i];
      } else {
        args.error = "--namespace requires a value";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--dump-ast") {
      args.dump_ast = true;
    } else if (arg == "--dump-json") {
      args.dump_json = true;
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

bool write_output(const fs::path & path, const std::string & text)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      fmt::print(
        stderr, "error: cannot create directory {}: {}\n", path.parent_path().string(),
        ec.message());
      return false;
    }
  }

  std::ofstream out(path);
  if (!out.is_open()) {
    fmt::print(stderr, "error: failed to open output file: {}\n", path.string());
    return false;
  }
  out << text;
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_generate(const CommandArgs & args)
{
  apigen::GeneratorOptions options;
  std::vector<std::string> decorators = {std::string(apigen::ObjectToJsonDecorator::k_name)};
  fs::path discovery_path;
  fs::path output_path;
  std::string decorators_location = "default decorators";

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find apigen.yaml
    auto config_path = apigen::find_project_config(fs::current_path());
    if (!config_path) {
      fmt::print(
        stderr, "error: no {} found in current directory or parents\n",
        apigen::k_project_config_file_name);
      return 1;
    }

    const auto config_result = apigen::load_project_config(*config_path);
    if (!config_result.success) {
      fmt::print(stderr, "error: {}: {}\n", config_path->string(), config_result.error);
      return 1;
    }
    const auto & config = config_result.config;

    if (args.verbose) {
      fmt::print(stderr, "Generating project: {}\n", config.package.name);
    }

    if (!args.input_file.empty()) {
      discovery_path = fs::absolute(args.input_file);
    } else if (auto configured = config.discovery_path()) {
      discovery_path = *configured;
    } else {
      fmt::print(stderr, "error: generator.discovery is not set in {}\n", config_path->string());
      return 1;
    }

    options.ns = config.generator.ns;
    decorators = config.generator.decorators;
    decorators_location = fmt::format("{}: generator.decorators", config_path->string());
    output_path = config.output_path();
  } else {
    discovery_path = fs::absolute(args.input_file);
  }

  if (!args.ns.empty()) {
    if (!apigen::is_valid_namespace(args.ns)) {
      fmt::print(stderr, "error: invalid namespace '{}'\n", args.ns);
      return 1;
    }
    options.ns = args.ns;
  }

  if (args.verbose) {
    fmt::print(stderr, "Loading: {}\n", discovery_path.string());
  }

  const auto loaded = apigen::discovery::load_service(discovery_path);
  if (!loaded.success) {
    fmt::print(stderr, "error: {}\n", loaded.error);
    return 1;
  }

  apigen::DiagnosticBag diagnostics;
  apigen::ServiceGenerator generator(options);
  const bool decorators_known =
    generator.add_decorators(decorators, diagnostics, decorators_location);

  if (args.verbose) {
    for (const auto name : generator.decorator_names()) {
      fmt::print(stderr, "Decorator: {}\n", name);
    }
  }

  apigen::AstContext ctx;
  apigen::CompileUnit * unit = nullptr;
  if (decorators_known) {
    unit = generator.generate(loaded.service, ctx, diagnostics);
  }

  if (!diagnostics.empty()) {
    print_diagnostics(diagnostics);
  }
  if (unit == nullptr || diagnostics.has_errors()) {
    return 1;
  }

  std::string text;
  if (args.dump_ast) {
    text = apigen::dump_to_string(unit);
  } else if (args.dump_json) {
    text = apigen::to_json(unit).dump(2) + "\n";
  } else {
    text = apigen::CSharpGenerator().generate(*unit);
  }

  if (!args.output_path.empty()) {
    output_path = args.output_path;
  } else if (!output_path.empty()) {
    const auto * cls = apigen::ServiceGenerator::service_class(*unit);
    output_path /= std::string(cls->name) + ".cs";
  }

  if (output_path.empty()) {
    std::cout << text;
    return 0;
  }

  if (!write_output(output_path, text)) {
    return 1;
  }
  fmt::print(stderr, "Generated: {}\n", output_path.string());
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    fmt::print(stderr, "error: project name required\n");
    fmt::print(stderr, "usage: apigen init <project-name>\n");
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    fmt::print(stderr, "error: directory already exists: {}\n", project_dir.string());
    return 1;
  }

  try {
    fs::create_directories(project_dir / "generated");

    if (!write_output(
          project_dir / apigen::k_project_config_file_name,
          apigen::default_project_config_text(args.input_file))) {
      return 1;
    }

    // Minimal discovery document so the project generates out of the box
    if (!write_output(
          project_dir / "discovery.json",
          apigen::discovery::default_discovery_text(args.input_file))) {
      return 1;
    }

    fmt::print("Initialized new apigen project in {}\n", project_dir.string());
    fmt::print("\nNext steps:\n  cd {}\n  apigen generate\n", args.input_file);

    return 0;
  } catch (const fs::filesystem_error & e) {
    fmt::print(stderr, "error: {}\n", e.what());
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
    fmt::print(stderr, "error: {}\n", args.error);
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "generate") {
    return cmd_generate(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  fmt::print(stderr, "error: unknown command '{}'\n", args.command);
  print_usage(argv[0]);
  return 1;
}
