// apigen/discovery/service.cpp - Discovery document reader
//
#include "apigen/discovery/service.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace apigen::discovery
{

namespace
{

using nlohmann::json;

/// Read an optional string member. Returns false if present with another type.
bool read_string(const json & obj, const char * key, std::string & out, std::string & error)
{
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

std::optional<Resource> parse_resource(
  const std::string & name, const json & node, std::string & error)
{
  if (!node.is_object()) {
    error = "resource '" + name + "' must be an object";
    return std::nullopt;
  }

  Resource res;
  res.name = name;

  if (const auto methods = node.find("methods"); methods != node.end()) {
    if (!methods->is_object()) {
      error = "'methods' of resource '" + name + "' must be an object";
      return std::nullopt;
    }
    for (const auto & item : methods->items()) {
      res.methods.push_back(item.key());
    }
  }

  if (const auto children = node.find("resources"); children != node.end()) {
    if (!children->is_object()) {
      error = "'resources' of resource '" + name + "' must be an object";
      return std::nullopt;
    }
    for (const auto & item : children->items()) {
      auto parsed = parse_resource(item.key(), item.value(), error);
      if (!parsed) {
        return std::nullopt;
      }
      res.resources.push_back(std::move(*parsed));
    }
  }

  return res;
}

}  // namespace

ServiceLoadResult parse_service(const json & doc)
{
  if (!doc.is_object()) {
    return ServiceLoadResult::fail("discovery document must be a JSON object");
  }

  const auto name = doc.find("name");
  if (name == doc.end() || !name->is_string() || name->get<std::string>().empty()) {
    return ServiceLoadResult::fail("discovery document has no service 'name'");
  }

  Service svc;
  svc.name = name->get<std::string>();

  std::string error;
  if (
    !read_string(doc, "version", svc.version, error) ||
    !read_string(doc, "title", svc.title, error) ||
    !read_string(doc, "description", svc.description, error) ||
    !read_string(doc, "rootUrl", svc.root_url, error) ||
    !read_string(doc, "servicePath", svc.service_path, error) ||
    !read_string(doc, "protocol", svc.protocol, error)) {
    return ServiceLoadResult::fail(error);
  }

  if (!read_string(doc, "basePath", svc.base_path, error)) {
    return ServiceLoadResult::fail(error);
  }
  if (svc.base_path.empty() && !read_string(doc, "restBasePath", svc.base_path, error)) {
    return ServiceLoadResult::fail(error);
  }

  if (const auto features = doc.find("features"); features != doc.end()) {
    if (!features->is_array()) {
      return ServiceLoadResult::fail("'features' must be a list");
    }
    for (const auto & f : *features) {
      if (!f.is_string()) {
        return ServiceLoadResult::fail("'features' entries must be strings");
      }
      svc.features.push_back(f.get<std::string>());
    }
  }

  if (const auto resources = doc.find("resources"); resources != doc.end()) {
    if (!resources->is_object()) {
      return ServiceLoadResult::fail("'resources' must be an object");
    }
    for (const auto & item : resources->items()) {
      auto parsed = parse_resource(item.key(), item.value(), error);
      if (!parsed) {
        return ServiceLoadResult::fail(error);
      }
      svc.resources.push_back(std::move(*parsed));
    }
  }

  return ServiceLoadResult::ok(std::move(svc));
}

ServiceLoadResult parse_service_text(std::string_view text)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return ServiceLoadResult::fail("failed to parse discovery document: " + std::string(e.what()));
  }
  return parse_service(doc);
}

ServiceLoadResult load_service(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return ServiceLoadResult::fail("discovery document not found: " + path.string());
  }

  std::ifstream in(path);
  if (!in) {
    return ServiceLoadResult::fail("cannot open discovery document: " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_service_text(buffer.str());
}

std::string default_discovery_text(std::string_view service_name)
{
  json doc;
  doc["kind"] = "discovery#restDescription";
  doc["name"] = std::string(service_name);
  doc["version"] = "v1";
  doc["protocol"] = "rest";
  doc["resources"] = json::object();

  // Names come from the command line and need not be valid UTF-8
  return doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

}  // namespace apigen::discovery
