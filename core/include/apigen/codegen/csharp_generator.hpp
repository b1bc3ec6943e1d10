// apigen/codegen/csharp_generator.hpp - Render the code-model AST as C# source
#pragma once

#include <cstddef>
#include <string>

#include "apigen/ast/ast.hpp"

namespace apigen
{

/**
 * Rendering options for the C# generator.
 */
struct CSharpOptions
{
  /// Spaces per indentation level
  std::size_t indentWidth = 4;

  /// Emit the "<auto-generated>" banner at the top of a compile unit
  bool emitBanner = true;
};

/**
 * C# source generator.
 *
 * Well-known CLR types are spelled with their C# keyword (System.String ->
 * string, System.Object -> object, ...); every other type is written fully
 * qualified, so the output needs no using directives. Binary expressions are
 * always parenthesized.
 */
class CSharpGenerator
{
public:
  CSharpGenerator() = default;
  explicit CSharpGenerator(CSharpOptions options) : options_(options) {}

  /// Render a whole file.
  [[nodiscard]] std::string generate(const CompileUnit & unit) const;

  /// Render a single class declaration (no namespace, no banner).
  [[nodiscard]] std::string generate(const ClassDecl & cls) const;

  /// Render one class member at indentation level 0.
  [[nodiscard]] std::string generate_member(const MemberDecl & member) const;

  /// Render one statement at indentation level 0.
  [[nodiscard]] std::string generate_statement(const Stmt & stmt) const;

  /// Render an expression.
  [[nodiscard]] static std::string render_expr(const Expr * expr);

  /// Render a type reference; nullptr renders as "void".
  [[nodiscard]] static std::string render_type(const TypeRef * type);

private:
  CSharpOptions options_;
};

}  // namespace apigen
