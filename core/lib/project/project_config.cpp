// apigen/project/project_config.cpp - Project configuration implementation
//
#include "apigen/project/project_config.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <string>

namespace apigen
{

namespace
{

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

/// Read a scalar as a string, or report `key` in `error`.
std::optional<std::string> scalar_string(
  const YAML::Node & node, const char * key, std::string & error)
{
  if (!node.IsScalar()) {
    error = std::string(key) + " must be a string";
    return std::nullopt;
  }
  return node.as<std::string>();
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (!pkg.IsMap()) {
      return ConfigLoadResult::fail("package must be a map");
    }
    if (pkg["name"]) {
      auto name = scalar_string(pkg["name"], "package.name", error);
      if (!name) return ConfigLoadResult::fail(error);
      config.package.name = std::move(*name);
    }
    if (pkg["version"]) {
      auto version = scalar_string(pkg["version"], "package.version", error);
      if (!version) return ConfigLoadResult::fail(error);
      config.package.version = std::move(*version);
    }
  }

  // Parse 'generator' section
  if (root["generator"]) {
    const auto & gen = root["generator"];
    if (!gen.IsMap()) {
      return ConfigLoadResult::fail("generator must be a map");
    }

    if (gen["discovery"]) {
      auto discovery = scalar_string(gen["discovery"], "generator.discovery", error);
      if (!discovery) return ConfigLoadResult::fail(error);
      config.generator.discovery = std::filesystem::path(*discovery);
    }

    if (gen["namespace"]) {
      auto ns = scalar_string(gen["namespace"], "generator.namespace", error);
      if (!ns) return ConfigLoadResult::fail(error);
      if (!is_valid_namespace(*ns)) {
        return ConfigLoadResult::fail(
          "invalid generator.namespace: '" + *ns + "' (must be a dotted identifier)");
      }
      config.generator.ns = std::move(*ns);
    }

    if (gen["output_dir"]) {
      auto dir = scalar_string(gen["output_dir"], "generator.output_dir", error);
      if (!dir) return ConfigLoadResult::fail(error);
      config.generator.output_dir = *dir;
    }

    if (gen["decorators"]) {
      if (!gen["decorators"].IsSequence()) {
        return ConfigLoadResult::fail("generator.decorators must be a list");
      }
      config.generator.decorators.clear();
      for (const auto & d : gen["decorators"]) {
        auto name = scalar_string(d, "generator.decorators entry", error);
        if (!name) return ConfigLoadResult::fail(error);
        config.generator.decorators.push_back(std::move(*name));
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<std::filesystem::path> ProjectConfig::discovery_path() const
{
  if (!generator.discovery) {
    return std::nullopt;
  }
  if (generator.discovery->is_absolute()) {
    return generator.discovery;
  }
  return project_root / *generator.discovery;
}

std::filesystem::path ProjectConfig::output_path() const
{
  if (generator.output_dir.is_absolute()) {
    return generator.output_dir;
  }
  return project_root / generator.output_dir;
}

bool is_valid_namespace(std::string_view ns)
{
  bool at_segment_start = true;
  for (const char c : ns) {
    if (c == '.') {
      if (at_segment_start) return false;
      at_segment_start = true;
    } else if (at_segment_start) {
      if (!is_ident_start(c)) return false;
      at_segment_start = false;
    } else if (!is_ident_char(c)) {
      return false;
    }
  }
  return !ns.empty() && !at_segment_start;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = parse_root(root);
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult parse_project_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config_text(std::string_view package_name)
{
  // Double-quoted scalar, so names with ':', '#', quotes or tabs read back unchanged
  YAML::Emitter quoted_name;
  quoted_name << YAML::DoubleQuoted << std::string(package_name);

  return fmt::format(
    "package:\n"
    "  name: {}\n"
    "  version: 0.1.0\n"
    "\n"
    "generator:\n"
    "  discovery: discovery.json\n"
    "  namespace: Google.Apis.Generated\n"
    "  output_dir: generated\n"
    "  decorators:\n"
    "    - object_to_json\n",
    quoted_name.c_str());
}

}  // namespace apigen
