// apigen/project/project_config.hpp - Project configuration (apigen.yaml)
//
// Parses and validates apigen.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apigen
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Generator configuration section.
 */
struct GeneratorConfig
{
  /// Discovery document to generate from (relative to apigen.yaml)
  std::optional<std::filesystem::path> discovery;

  /// C# namespace of the generated service class
  std::string ns = "Google.Apis.Generated";

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";

  /// Decorators run over the service class, in order
  std::vector<std::string> decorators = {"object_to_json"};
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (apigen.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  GeneratorConfig generator;

  /// Directory containing apigen.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Discovery document path resolved against project_root, if configured.
  [[nodiscard]] std::optional<std::filesystem::path> discovery_path() const;

  /// Output directory resolved against project_root.
  [[nodiscard]] std::filesystem::path output_path() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an apigen.yaml file.
 *
 * @param config_path Path to apigen.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse project configuration text. project_root is left empty.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * Searches for apigen.yaml starting from start_dir and moving up the
 * directory hierarchy until the filesystem root.
 *
 * @param start_dir Directory to start searching from
 * @return Path to apigen.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * apigen.yaml contents written by `apigen init`.
 */
[[nodiscard]] std::string default_project_config_text(std::string_view package_name);

/**
 * Whether `ns` is a dotted C# namespace ("Google.Apis.Books").
 */
[[nodiscard]] bool is_valid_namespace(std::string_view ns);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "apigen.yaml";

}  // namespace apigen
