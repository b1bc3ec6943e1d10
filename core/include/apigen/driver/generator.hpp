// apigen/driver/generator.hpp - Service class generation pipeline
//
// Builds the compile unit for one service and runs the configured decorators
// over its service class.
//
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_context.hpp"
#include "apigen/basic/diagnostic.hpp"
#include "apigen/decorator/service_decorator.hpp"
#include "apigen/discovery/service.hpp"

namespace apigen
{

struct GeneratorOptions
{
  /// Namespace the service class is placed in
  std::string ns = "Google.Apis.Generated";

  /// Copy the service description into the class doc comment
  bool emitDocs = true;
};

/**
 * Create a decorator from its configuration name.
 *
 * @return nullptr if no decorator is registered under `name`
 */
[[nodiscard]] std::unique_ptr<ServiceDecorator> make_decorator(std::string_view name);

/// Configuration names accepted by make_decorator(), in registration order.
[[nodiscard]] const std::vector<std::string_view> & available_decorators();

/**
 * Service class name for a discovery service name.
 *
 * The first letter is upper-cased and "Service" appended ("books" ->
 * "BooksService"). Characters that cannot appear in a C# identifier are
 * dropped and the letter following them is upper-cased
 * ("cloud-resource" -> "CloudResourceService").
 */
[[nodiscard]] std::string service_class_name(std::string_view serviceName);

/**
 * Runs decorators over a freshly built service class.
 *
 * Decorators run once each, in the order they were added.
 */
class ServiceGenerator
{
public:
  ServiceGenerator() = default;
  explicit ServiceGenerator(GeneratorOptions options) : options_(std::move(options)) {}

  ServiceGenerator(const ServiceGenerator &) = delete;
  ServiceGenerator & operator=(const ServiceGenerator &) = delete;
  ServiceGenerator(ServiceGenerator &&) = default;
  ServiceGenerator & operator=(ServiceGenerator &&) = default;

  [[nodiscard]] const GeneratorOptions & options() const noexcept { return options_; }

  void add_decorator(std::unique_ptr<ServiceDecorator> decorator);

  /**
   * Add decorators by configuration name.
   *
   * Unknown names are reported as errors (E0101) and skipped; a name listed
   * twice is reported as a warning (W0101) and added again.
   *
   * @param location Where the names came from, used in diagnostics
   * @return false if any name was unknown
   */
  bool add_decorators(
    const std::vector<std::string> & names, DiagnosticBag & diags,
    std::string_view location = "generator.decorators");

  [[nodiscard]] std::size_t decorator_count() const noexcept { return decorators_.size(); }

  /// Names of the registered decorators, in run order.
  [[nodiscard]] std::vector<std::string_view> decorator_names() const;

  /**
   * Build `namespace <ns> { public class <Name>Service }` for `service` in
   * `ctx` and run every decorator over the class.
   *
   * @return nullptr (with an E0102 error in `diags`) if the service has no name
   */
  CompileUnit * generate(
    const discovery::Service & service, AstContext & ctx, DiagnosticBag & diags);

  /// The service class of a unit returned by generate().
  [[nodiscard]] static ClassDecl * service_class(const CompileUnit & unit) noexcept;

private:
  GeneratorOptions options_;
  std::vector<std::unique_ptr<ServiceDecorator>> decorators_;
};

}  // namespace apigen
