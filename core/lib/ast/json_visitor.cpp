// apigen/ast/json_visitor.cpp - JSON serialization implementation
//
#include "apigen/ast/json_visitor.hpp"

#include <gsl/span>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_enums.hpp"
#include "apigen/basic/casting.hpp"

namespace apigen
{
namespace
{

using nlohmann::json;

json j_node(const AstNode * n);

template <typename T>
json j_list(gsl::span<T *> nodes)
{
  json arr = json::array();
  for (const auto * n : nodes) {
    arr.push_back(j_node(n));
  }
  return arr;
}

json j_member_common(const MemberDecl * m, const char * type)
{
  return json{
    {"type", type},
    {"name", std::string(m->name)},
    {"access", std::string(to_string(m->access))},
    {"static", m->isStatic}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (isa<NullLiteralExpr>(e)) {
    return json{{"type", "NullLiteralExpr"}};
  }

  if (const auto * lit = dyn_cast<BoolLiteralExpr>(e)) {
    return json{{"type", "BoolLiteralExpr"}, {"value", lit->value}};
  }

  if (const auto * lit = dyn_cast<IntLiteralExpr>(e)) {
    return json{{"type", "IntLiteralExpr"}, {"value", lit->value}};
  }

  if (const auto * lit = dyn_cast<StringLiteralExpr>(e)) {
    return json{{"type", "StringLiteralExpr"}, {"value", std::string(lit->value)}};
  }

  if (isa<ThisRefExpr>(e)) {
    return json{{"type", "ThisRefExpr"}};
  }

  if (const auto * v = dyn_cast<VarRefExpr>(e)) {
    return json{{"type", "VarRefExpr"}, {"name", std::string(v->name)}};
  }

  if (const auto * t = dyn_cast<TypeRefExpr>(e)) {
    return json{{"type", "TypeRefExpr"}, {"typeRef", j_node(t->type)}};
  }

  if (const auto * f = dyn_cast<FieldRefExpr>(e)) {
    return json{
      {"type", "FieldRefExpr"}, {"target", j_node(f->target)}, {"name", std::string(f->name)}};
  }

  if (const auto * p = dyn_cast<PropertyRefExpr>(e)) {
    return json{
      {"type", "PropertyRefExpr"}, {"target", j_node(p->target)}, {"name", std::string(p->name)}};
  }

  if (const auto * c = dyn_cast<ObjectCreateExpr>(e)) {
    return json{{"type", "ObjectCreateExpr"}, {"typeRef", j_node(c->type)}, {"args", j_list(c->args)}};
  }

  if (const auto * call = dyn_cast<MethodInvokeExpr>(e)) {
    return json{
      {"type", "MethodInvokeExpr"},
      {"target", j_node(call->target)},
      {"method", std::string(call->method)},
      {"args", j_list(call->args)}};
  }

  if (const auto * b = dyn_cast<BinaryExpr>(e)) {
    return json{
      {"type", "BinaryExpr"},
      {"op", std::string(operator_name(b->op))},
      {"lhs", j_node(b->lhs)},
      {"rhs", j_node(b->rhs)}};
  }

  return json{{"type", "UnknownExpr"}};
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (const auto * v = dyn_cast<VarDeclStmt>(s)) {
    return json{
      {"type", "VarDeclStmt"},
      {"typeRef", j_node(v->type)},
      {"name", std::string(v->name)},
      {"init", j_node(v->initExpr)}};
  }

  if (const auto * a = dyn_cast<AssignStmt>(s)) {
    return json{{"type", "AssignStmt"}, {"lhs", j_node(a->lhs)}, {"rhs", j_node(a->rhs)}};
  }

  if (const auto * es = dyn_cast<ExprStmt>(s)) {
    return json{{"type", "ExprStmt"}, {"expr", j_node(es->expr)}};
  }

  if (const auto * i = dyn_cast<IfStmt>(s)) {
    return json{
      {"type", "IfStmt"},
      {"condition", j_node(i->condition)},
      {"trueStmts", j_list(i->trueStmts)},
      {"falseStmts", j_list(i->falseStmts)}};
  }

  if (const auto * r = dyn_cast<ReturnStmt>(s)) {
    return json{{"type", "ReturnStmt"}, {"value", j_node(r->value)}};
  }

  return json{{"type", "UnknownStmt"}};
}

// ============================================================================
// Member serialization
// ============================================================================

json j_member(const MemberDecl * m)
{
  if (const auto * f = dyn_cast<FieldDecl>(m)) {
    json j = j_member_common(f, "FieldDecl");
    j["typeRef"] = j_node(f->type);
    j["init"] = j_node(f->initExpr);
    return j;
  }

  if (const auto * p = dyn_cast<PropertyDecl>(m)) {
    json j = j_member_common(p, "PropertyDecl");
    j["typeRef"] = j_node(p->type);
    j["hasGet"] = p->hasGet;
    j["hasSet"] = p->hasSet;
    j["getStmts"] = j_list(p->getStmts);
    j["setStmts"] = j_list(p->setStmts);
    return j;
  }

  if (const auto * md = dyn_cast<MethodDecl>(m)) {
    json j = j_member_common(md, "MethodDecl");
    j["returnType"] = j_node(md->returnType);
    j["params"] = j_list(md->params);
    j["body"] = j_list(md->body);
    return j;
  }

  return json{{"type", "UnknownMember"}};
}

// ============================================================================
// Dispatch
// ============================================================================

json j_node(const AstNode * n)
{
  if (!n) return nullptr;

  if (const auto * e = dyn_cast<Expr>(n)) return j_expr(e);
  if (const auto * s = dyn_cast<Stmt>(n)) return j_stmt(s);
  if (const auto * m = dyn_cast<MemberDecl>(n)) return j_member(m);

  if (const auto * t = dyn_cast<TypeRef>(n)) {
    return json{{"type", "TypeRef"}, {"name", std::string(t->name)}, {"typeArgs", j_list(t->typeArgs)}};
  }

  if (const auto * p = dyn_cast<ParamDecl>(n)) {
    return json{{"type", "ParamDecl"}, {"typeRef", j_node(p->type)}, {"name", std::string(p->name)}};
  }

  if (const auto * c = dyn_cast<ClassDecl>(n)) {
    json docs = json::array();
    for (const auto doc : c->docs) {
      docs.push_back(std::string(doc));
    }
    return json{
      {"type", "ClassDecl"},
      {"name", std::string(c->name)},
      {"access", std::string(to_string(c->access))},
      {"partial", c->isPartial},
      {"baseTypes", j_list(c->baseTypes)},
      {"docs", docs},
      {"members", j_list(c->members)}};
  }

  if (const auto * ns = dyn_cast<NamespaceDecl>(n)) {
    json imports = json::array();
    for (const auto imported : ns->imports) {
      imports.push_back(std::string(imported));
    }
    return json{
      {"type", "NamespaceDecl"},
      {"name", std::string(ns->name)},
      {"imports", imports},
      {"classes", j_list(ns->classes)}};
  }

  if (const auto * cu = dyn_cast<CompileUnit>(n)) {
    return json{{"type", "CompileUnit"}, {"namespaces", j_list(cu->namespaces)}};
  }

  return json{{"type", "Unknown"}};
}

}  // namespace

json to_json(const AstNode * node) { return j_node(node); }

}  // namespace apigen
