// apigen/discovery/service.hpp - Service description read from a discovery document
//
// Only the parts of a discovery document the generator looks at are modeled.
// Decorators receive the Service read-only and may ignore it entirely.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apigen::discovery
{

/**
 * A resource of the service with the names of its methods.
 * Resources nest (e.g. "users" -> "messages").
 */
struct Resource
{
  std::string name;
  std::vector<std::string> methods;
  std::vector<Resource> resources;
};

/**
 * Description of a network service.
 */
struct Service
{
  std::string name;         ///< required, e.g. "plus"
  std::string version;      ///< e.g. "v1"
  std::string title;
  std::string description;
  std::string root_url;     ///< "rootUrl"
  std::string service_path; ///< "servicePath"
  std::string base_path;    ///< "basePath" (falls back to "restBasePath")
  std::string protocol = "rest";
  std::vector<std::string> features;
  std::vector<Resource> resources;
};

/**
 * Result of reading a service description.
 */
struct ServiceLoadResult
{
  /// Loaded service (only valid if success == true)
  Service service;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ServiceLoadResult ok(Service svc)
  {
    ServiceLoadResult r;
    r.service = std::move(svc);
    r.success = true;
    return r;
  }

  static ServiceLoadResult fail(std::string msg)
  {
    ServiceLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Build a Service from an already-parsed discovery document.
 *
 * Fails when the document is not an object, has no string "name", or when a
 * known key has the wrong JSON type.
 */
[[nodiscard]] ServiceLoadResult parse_service(const nlohmann::json & doc);

/**
 * Parse discovery document text and build a Service from it.
 */
[[nodiscard]] ServiceLoadResult parse_service_text(std::string_view text);

/**
 * Read and parse a discovery document from disk.
 */
[[nodiscard]] ServiceLoadResult load_service(const std::filesystem::path & path);

/**
 * Minimal discovery document for a new project: kind, name, version "v1",
 * protocol "rest" and no resources.
 *
 * `service_name` is stored verbatim; parse_service_text() reads it back
 * unchanged whatever characters it contains.
 */
[[nodiscard]] std::string default_discovery_text(std::string_view service_name);

}  // namespace apigen::discovery
