// apigen/ast/code_factory.cpp
//
#include "apigen/ast/code_factory.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace apigen
{

TypeRef * CodeFactory::type(std::string_view fullName)
{
  return ctx_.create<TypeRef>(name(fullName));
}

TypeRef * CodeFactory::generic_type(
  std::string_view fullName, std::initializer_list<TypeRef *> args)
{
  return ctx_.create<TypeRef>(name(fullName), ctx_.copy_to_arena(args));
}

NullLiteralExpr * CodeFactory::null() { return ctx_.create<NullLiteralExpr>(); }

BoolLiteralExpr * CodeFactory::bool_literal(bool value) { return ctx_.create<BoolLiteralExpr>(value); }

IntLiteralExpr * CodeFactory::int_literal(int64_t value) { return ctx_.create<IntLiteralExpr>(value); }

StringLiteralExpr * CodeFactory::string_literal(std::string_view value)
{
  return ctx_.create<StringLiteralExpr>(name(value));
}

ThisRefExpr * CodeFactory::this_ref() { return ctx_.create<ThisRefExpr>(); }

VarRefExpr * CodeFactory::var(std::string_view varName)
{
  return ctx_.create<VarRefExpr>(name(varName));
}

TypeRefExpr * CodeFactory::type_expr(std::string_view fullName)
{
  return ctx_.create<TypeRefExpr>(type(fullName));
}

FieldRefExpr * CodeFactory::field(Expr * target, std::string_view fieldName)
{
  return ctx_.create<FieldRefExpr>(target, name(fieldName));
}

PropertyRefExpr * CodeFactory::property(Expr * target, std::string_view propertyName)
{
  return ctx_.create<PropertyRefExpr>(target, name(propertyName));
}

ObjectCreateExpr * CodeFactory::create_object(
  std::string_view fullName, std::initializer_list<Expr *> args)
{
  return ctx_.create<ObjectCreateExpr>(type(fullName), ctx_.copy_to_arena(args));
}

MethodInvokeExpr * CodeFactory::invoke(
  Expr * target, std::string_view method, std::initializer_list<Expr *> args)
{
  return ctx_.create<MethodInvokeExpr>(target, name(method), ctx_.copy_to_arena(args));
}

BinaryExpr * CodeFactory::binary(Expr * lhs, BinaryOp op, Expr * rhs)
{
  return ctx_.create<BinaryExpr>(lhs, op, rhs);
}

VarDeclStmt * CodeFactory::declare(std::string_view typeName, std::string_view varName, Expr * init)
{
  return ctx_.create<VarDeclStmt>(type(typeName), name(varName), init);
}

AssignStmt * CodeFactory::assign(Expr * lhs, Expr * rhs) { return ctx_.create<AssignStmt>(lhs, rhs); }

ExprStmt * CodeFactory::eval(Expr * expr) { return ctx_.create<ExprStmt>(expr); }

IfStmt * CodeFactory::if_then(Expr * condition, gsl::span<Stmt *> trueStmts)
{
  return ctx_.create<IfStmt>(condition, trueStmts);
}

ReturnStmt * CodeFactory::ret(Expr * value) { return ctx_.create<ReturnStmt>(value); }

gsl::span<Stmt *> CodeFactory::block(std::initializer_list<Stmt *> stmts)
{
  return ctx_.copy_to_arena(stmts);
}

ParamDecl * CodeFactory::param(std::string_view typeName, std::string_view paramName)
{
  return ctx_.create<ParamDecl>(type(typeName), name(paramName));
}

}  // namespace apigen
