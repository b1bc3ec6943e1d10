// apigen/ast/code_factory.hpp - Convenience constructors for code-model nodes
//
// Decorators build members through a CodeFactory instead of calling
// AstContext::create directly. Every string handed to the factory is interned,
// so callers may pass temporaries.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <initializer_list>
#include <string_view>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_context.hpp"
#include "apigen/ast/ast_enums.hpp"

namespace apigen
{

/**
 * Thin builder over an AstContext.
 *
 * @code
 *   CodeFactory f(ctx);
 *   // this.cache == null
 *   auto* cond = f.binary(f.this_field("cache"), BinaryOp::IdentityEquality, f.null());
 * @endcode
 */
class CodeFactory
{
public:
  explicit CodeFactory(AstContext & ctx) : ctx_(ctx) {}

  [[nodiscard]] AstContext & context() noexcept { return ctx_; }

  [[nodiscard]] std::string_view name(std::string_view s) { return ctx_.intern(s); }

  // --- Types ---
  TypeRef * type(std::string_view fullName);
  TypeRef * generic_type(std::string_view fullName, std::initializer_list<TypeRef *> args);

  // --- Expressions ---
  NullLiteralExpr * null();
  BoolLiteralExpr * bool_literal(bool value);
  IntLiteralExpr * int_literal(int64_t value);
  StringLiteralExpr * string_literal(std::string_view value);
  ThisRefExpr * this_ref();
  VarRefExpr * var(std::string_view varName);
  TypeRefExpr * type_expr(std::string_view fullName);
  FieldRefExpr * field(Expr * target, std::string_view fieldName);
  PropertyRefExpr * property(Expr * target, std::string_view propertyName);
  ObjectCreateExpr * create_object(std::string_view fullName, std::initializer_list<Expr *> args = {});
  MethodInvokeExpr * invoke(
    Expr * target, std::string_view method, std::initializer_list<Expr *> args = {});
  BinaryExpr * binary(Expr * lhs, BinaryOp op, Expr * rhs);

  /// this.<fieldName>
  FieldRefExpr * this_field(std::string_view fieldName) { return field(this_ref(), fieldName); }

  /// this.<propertyName>
  PropertyRefExpr * this_property(std::string_view propertyName)
  {
    return property(this_ref(), propertyName);
  }

  // --- Statements ---
  VarDeclStmt * declare(std::string_view typeName, std::string_view varName, Expr * init = nullptr);
  AssignStmt * assign(Expr * lhs, Expr * rhs);
  ExprStmt * eval(Expr * expr);
  IfStmt * if_then(Expr * condition, gsl::span<Stmt *> trueStmts);
  ReturnStmt * ret(Expr * value = nullptr);

  /// Arena-backed statement list.
  gsl::span<Stmt *> block(std::initializer_list<Stmt *> stmts);

  // --- Declarations ---
  ParamDecl * param(std::string_view typeName, std::string_view paramName);

  /// Append a member to the end of a class. Existing members are untouched.
  void add_member(ClassDecl & cls, MemberDecl * member) { ctx_.append(cls.members, member); }

private:
  AstContext & ctx_;
};

}  // namespace apigen
