#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "apigen/ast/ast_context.hpp"
#include "apigen/basic/diagnostic.hpp"
#include "apigen/codegen/csharp_generator.hpp"
#include "apigen/discovery/service.hpp"
#include "apigen/driver/generator.hpp"
#include "apigen/project/project_config.hpp"

using namespace apigen;

namespace
{

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open file: " + p.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("failed to write file: " + p.string());
  }
  out << content;
}

std::string normalize_text(const std::string & s)
{
  // Normalize CRLF/CR to LF and trim trailing whitespace per line
  std::string out;
  out.reserve(s.size());
  std::string line;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '\r') {
      if (i + 1 < s.size() && s[i + 1] == '\n') {
        ++i;
      }
      c = '\n';
    }
    if (c == '\n') {
      while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
      }
      out += line;
      out.push_back('\n');
      line.clear();
    } else {
      line.push_back(c);
    }
  }
  out += line;
  if (!out.empty() && out.back() != '\n') {
    out.push_back('\n');
  }
  return out;
}

void fail_diff_hint(
  std::string_view label, const std::string & expected, const std::string & actual)
{
  const size_t n = std::min(expected.size(), actual.size());
  size_t pos = 0;
  for (; pos < n; ++pos) {
    if (expected[pos] != actual[pos]) break;
  }

  std::cerr << "Mismatch in " << label << " at byte " << pos << "\n";
  const size_t start = (pos > 80) ? (pos - 80) : 0;
  const size_t end = std::min(pos + 200, n);
  std::cerr << "--- expected (snippet) ---\n";
  std::cerr << expected.substr(start, end - start) << "\n";
  std::cerr << "--- actual (snippet) ---\n";
  std::cerr << actual.substr(start, end - start) << "\n";
}

std::filesystem::path get_this_dir() { return std::filesystem::absolute(__FILE__).parent_path(); }

std::filesystem::path inputs_dir() { return get_this_dir() / "golden" / "inputs"; }
std::filesystem::path expected_dir() { return get_this_dir() / "golden" / "expected"; }

std::vector<std::filesystem::path> list_discovery_files(const std::filesystem::path & dir)
{
  std::vector<std::filesystem::path> files;
  for (const auto & ent : std::filesystem::directory_iterator(dir)) {
    if (!ent.is_regular_file()) continue;
    if (ent.path().extension() == ".json") {
      files.push_back(ent.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

void print_diagnostics(const DiagnosticBag & diags)
{
  for (const auto & d : diags.all()) {
    std::cerr << d.code << ": " << d.message << "\n";
  }
}

bool should_update_golden()
{
  const char * v = std::getenv("APIGEN_UPDATE_GOLDEN");
  return v != nullptr && *v != '\0' && std::string_view(v) != "0";
}

/// The same pipeline `apigen generate <file>` runs with default settings.
std::string generate_source(const std::filesystem::path & discovery_file, DiagnosticBag & diags)
{
  const auto loaded = discovery::load_service(discovery_file);
  if (!loaded.success) {
    ADD_FAILURE() << loaded.error;
    return {};
  }

  const ProjectConfig defaults;
  ServiceGenerator gen(GeneratorOptions{defaults.generator.ns, true});
  if (!gen.add_decorators(defaults.generator.decorators, diags)) {
    return {};
  }

  AstContext ctx;
  const auto * unit = gen.generate(loaded.service, ctx, diags);
  if (unit == nullptr) {
    return {};
  }
  return CSharpGenerator().generate(*unit);
}

void run_one(const std::filesystem::path & discovery_file)
{
  const std::string stem = discovery_file.stem().string();

  DiagnosticBag diags;
  const std::string actual = normalize_text(generate_source(discovery_file, diags));
  if (diags.has_errors()) {
    print_diagnostics(diags);
  }
  ASSERT_FALSE(diags.has_errors()) << "generation failed: " << discovery_file.string();
  ASSERT_FALSE(actual.empty());

  const auto expected_path = expected_dir() / (stem + ".cs");

  if (should_update_golden()) {
    write_file(expected_path, actual);
    return;
  }

  ASSERT_TRUE(std::filesystem::exists(expected_path))
    << "missing golden: " << expected_path.string()
    << " (set APIGEN_UPDATE_GOLDEN=1 to create it)";

  const std::string expected = normalize_text(read_file(expected_path));
  if (expected != actual) {
    fail_diff_hint(stem + ".cs", expected, actual);
  }
  EXPECT_EQ(expected, actual) << "golden mismatch: " << expected_path.string();
}

}  // namespace

TEST(GoldenOutputs, AllInputsMatchExpected)
{
  const auto files = list_discovery_files(inputs_dir());
  ASSERT_FALSE(files.empty()) << "no inputs in " << inputs_dir().string();

  for (const auto & f : files) {
    SCOPED_TRACE(f.filename().string());
    run_one(f);
  }
}

TEST(GoldenOutputs, OutputDoesNotDependOnResources)
{
  const auto loaded = discovery::load_service(inputs_dir() / "plus.json");
  ASSERT_TRUE(loaded.success) << loaded.error;

  auto stripped = loaded.service;
  stripped.resources.clear();
  stripped.root_url.clear();

  const auto render = [](const discovery::Service & svc) {
    AstContext ctx;
    DiagnosticBag diags;
    ServiceGenerator gen;
    EXPECT_TRUE(gen.add_decorators({"object_to_json"}, diags));
    const auto * unit = gen.generate(svc, ctx, diags);
    EXPECT_NE(unit, nullptr);
    return unit ? CSharpGenerator().generate(*unit) : std::string();
  };

  EXPECT_EQ(render(loaded.service), render(stripped));
}
