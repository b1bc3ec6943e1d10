// apigen/test_support/service_helpers.hpp - helpers for unit/integration tests
//
// A service description plus an empty service class, owned together so tests
// can decorate the class and inspect the result.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_context.hpp"
#include "apigen/discovery/service.hpp"
#include "apigen/driver/generator.hpp"

namespace apigen::test_support
{

struct TestServiceUnit
{
  std::unique_ptr<AstContext> ast;
  discovery::Service service;
  ClassDecl * serviceClass = nullptr;
};

[[nodiscard]] inline discovery::Service make_service(std::string name = "plus")
{
  discovery::Service svc;
  svc.name = std::move(name);
  svc.version = "v1";
  svc.title = "Test API";
  return svc;
}

/// Service `name` with an empty `public class <Name>Service`.
[[nodiscard]] inline TestServiceUnit make_service_class(std::string name = "plus")
{
  TestServiceUnit out;
  out.ast = std::make_unique<AstContext>();
  out.service = make_service(std::move(name));
  out.serviceClass =
    out.ast->create<ClassDecl>(out.ast->intern(service_class_name(out.service.name)));
  return out;
}

}  // namespace apigen::test_support
