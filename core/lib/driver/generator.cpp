// apigen/driver/generator.cpp - Service class generation pipeline
//
#include "apigen/driver/generator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <unordered_set>
#include <utility>

#include "apigen/decorator/object_to_json.hpp"

namespace apigen
{

namespace
{

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

std::vector<std::string_view> split_lines(std::string_view text)
{
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    const auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (nl == std::string_view::npos) {
      break;
    }
    text.remove_prefix(nl + 1);
  }
  return lines;
}

std::string join(const std::vector<std::string_view> & names)
{
  std::string out;
  for (const auto & n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

}  // namespace

// ============================================================================
// Decorator registry
// ============================================================================

const std::vector<std::string_view> & available_decorators()
{
  static const std::vector<std::string_view> k_names = {ObjectToJsonDecorator::k_name};
  return k_names;
}

std::unique_ptr<ServiceDecorator> make_decorator(std::string_view name)
{
  if (name == ObjectToJsonDecorator::k_name) {
    return std::make_unique<ObjectToJsonDecorator>();
  }
  return nullptr;
}

std::string service_class_name(std::string_view serviceName)
{
  std::string out;
  out.reserve(serviceName.size() + 7);
  bool upper_next = true;
  for (const char c : serviceName) {
    if (!is_ident_char(c)) {
      upper_next = true;
      continue;
    }
    if (out.empty() && std::isdigit(static_cast<unsigned char>(c))) {
      out.push_back('_');
    }
    out.push_back(upper_next ? to_upper(c) : c);
    upper_next = false;
  }
  out += "Service";
  return out;
}

// ============================================================================
// ServiceGenerator
// ============================================================================

void ServiceGenerator::add_decorator(std::unique_ptr<ServiceDecorator> decorator)
{
  if (decorator) {
    decorators_.push_back(std::move(decorator));
  }
}

bool ServiceGenerator::add_decorators(
  const std::vector<std::string> & names, DiagnosticBag & diags, std::string_view location)
{
  bool all_known = true;
  std::unordered_set<std::string> seen;

  for (std::size_t i = 0; i < names.size(); ++i) {
    const std::string & name = names[i];
    const std::string where = fmt::format("{}[{}]", location, i);

    auto decorator = make_decorator(name);
    if (!decorator) {
      diags
        .report_error(
          where, fmt::format("unknown decorator '{}'", name), "not a registered decorator")
        .with_code(diag_code::k_unknown_decorator)
        .with_help(fmt::format("available decorators: {}", join(available_decorators())));
      all_known = false;
      continue;
    }

    if (!seen.insert(name).second) {
      diags.report_warning(where, fmt::format("decorator '{}' is listed more than once", name))
        .with_code(diag_code::k_duplicate_decorator)
        .with_help("each occurrence runs again and adds duplicate members");
    }
    add_decorator(std::move(decorator));
  }

  return all_known;
}

std::vector<std::string_view> ServiceGenerator::decorator_names() const
{
  std::vector<std::string_view> names;
  names.reserve(decorators_.size());
  std::transform(
    decorators_.begin(), decorators_.end(), std::back_inserter(names),
    [](const auto & d) { return d->name(); });
  return names;
}

CompileUnit * ServiceGenerator::generate(
  const discovery::Service & service, AstContext & ctx, DiagnosticBag & diags)
{
  if (service.name.empty()) {
    diags.report_error("name", "service has no name", "required to name the service class")
      .with_code(diag_code::k_empty_service_name);
    return nullptr;
  }

  auto * cls = ctx.create<ClassDecl>(ctx.intern(service_class_name(service.name)));
  cls->access = MemberAccess::Public;

  if (options_.emitDocs) {
    std::vector<std::string_view> docs;
    const std::string & summary = service.description.empty() ? service.title : service.description;
    for (const auto line : split_lines(summary)) {
      docs.push_back(ctx.intern(line));
    }
    cls->docs = ctx.copy_to_arena(docs);
  }

  auto * ns = ctx.create<NamespaceDecl>(ctx.intern(options_.ns));
  ns->classes = ctx.copy_to_arena({cls});

  auto * unit = ctx.create<CompileUnit>();
  unit->namespaces = ctx.copy_to_arena({ns});

  for (const auto & decorator : decorators_) {
    decorator->decorate_class(service, *cls, ctx);
  }

  return unit;
}

ClassDecl * ServiceGenerator::service_class(const CompileUnit & unit) noexcept
{
  if (unit.namespaces.empty() || unit.namespaces[0]->classes.empty()) {
    return nullptr;
  }
  return unit.namespaces[0]->classes[0];
}

}  // namespace apigen
