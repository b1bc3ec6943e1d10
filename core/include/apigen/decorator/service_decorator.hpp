// apigen/decorator/service_decorator.hpp - Service class decorator interface
//
// A decorator adds members to the generated service class. The generator
// runs decorators one after another over the same class.
//
#pragma once

#include <string_view>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_context.hpp"
#include "apigen/discovery/service.hpp"

namespace apigen
{

/**
 * Interface implemented by every service class decorator.
 *
 * Decorators only append to `serviceClass.members`; they never remove or
 * reorder what earlier decorators produced. New nodes are allocated in `ctx`,
 * which must be the context owning `serviceClass`.
 */
class ServiceDecorator
{
public:
  virtual ~ServiceDecorator() = default;

  /// Name used to enable the decorator in apigen.yaml.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  virtual void decorate_class(
    const discovery::Service & service, ClassDecl & serviceClass, AstContext & ctx) = 0;

protected:
  ServiceDecorator() = default;
  ServiceDecorator(const ServiceDecorator &) = default;
  ServiceDecorator & operator=(const ServiceDecorator &) = default;
};

}  // namespace apigen
