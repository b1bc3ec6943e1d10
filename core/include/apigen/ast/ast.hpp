// apigen/ast/ast.hpp - Code-model AST node class definitions
//
// The nodes describe generated source (namespaces, classes, members,
// statements and expressions) independently of the target language. They
// follow the LLVM/Clang style with classof() for RTTI support and are
// allocated in an AstContext arena.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "apigen/ast/ast_enums.hpp"
#include "apigen/basic/casting.hpp"

namespace apigen
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node carries a NodeKind for RTTI (classof pattern).
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit AstNode(NodeKind k) : kind(k) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Base(K) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/// Base class for expressions.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k) : AstNode(k) {}
};

/// Base class for statements.
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k) : AstNode(k) {}
};

/// Base class for class members (fields, properties, methods).
class MemberDecl : public AstNode
{
public:
  std::string_view name;
  MemberAccess access = MemberAccess::Private;
  bool isStatic = false;

  static bool classof(const AstNode * node) { return is_member_kind(node->kind); }

protected:
  explicit MemberDecl(NodeKind k) : AstNode(k) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/**
 * Reference to a type by its fully-qualified name.
 *
 * `name` is the dotted .NET-style name (e.g. "System.IO.TextWriter");
 * emitters decide how to spell it.
 */
class TypeRef : public NodeBase<TypeRef, AstNode, NodeKind::TypeRef>
{
public:
  std::string_view name;
  gsl::span<TypeRef *> typeArgs;

  explicit TypeRef(std::string_view n) : name(n) {}

  TypeRef(std::string_view n, gsl::span<TypeRef *> args) : name(n), typeArgs(args) {}
};

/// Method parameter declaration.
class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  TypeRef * type;
  std::string_view name;

  ParamDecl(TypeRef * t, std::string_view n) : type(t), name(n) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// `null`
class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  NullLiteralExpr() = default;
};

/// Boolean literal expression.
class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v) : value(v) {}
};

/// Integer literal expression.
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v) : value(v) {}
};

/// String literal expression (unescaped contents).
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v) : value(v) {}
};

/// `this`
class ThisRefExpr : public NodeBase<ThisRefExpr, Expr, NodeKind::ThisRef>
{
public:
  ThisRefExpr() = default;
};

/// Reference to a local variable or parameter.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n) : name(n) {}
};

/// A type used in expression position (target of a static member access).
class TypeRefExpr : public NodeBase<TypeRefExpr, Expr, NodeKind::TypeRefExpr>
{
public:
  TypeRef * type;

  explicit TypeRefExpr(TypeRef * t) : type(t) {}
};

/// Field access: target.name
class FieldRefExpr : public NodeBase<FieldRefExpr, Expr, NodeKind::FieldRef>
{
public:
  Expr * target;
  std::string_view name;

  FieldRefExpr(Expr * t, std::string_view n) : target(t), name(n) {}
};

/// Property access: target.name
class PropertyRefExpr : public NodeBase<PropertyRefExpr, Expr, NodeKind::PropertyRef>
{
public:
  Expr * target;
  std::string_view name;

  PropertyRefExpr(Expr * t, std::string_view n) : target(t), name(n) {}
};

/// Object construction: new Type(args...)
class ObjectCreateExpr : public NodeBase<ObjectCreateExpr, Expr, NodeKind::ObjectCreate>
{
public:
  TypeRef * type;
  gsl::span<Expr *> args;

  explicit ObjectCreateExpr(TypeRef * t) : type(t) {}

  ObjectCreateExpr(TypeRef * t, gsl::span<Expr *> a) : type(t), args(a) {}
};

/// Method call: target.method(args...). A null target calls an unqualified method.
class MethodInvokeExpr : public NodeBase<MethodInvokeExpr, Expr, NodeKind::MethodInvoke>
{
public:
  Expr * target;
  std::string_view method;
  gsl::span<Expr *> args;

  MethodInvokeExpr(Expr * t, std::string_view m) : target(t), method(m) {}

  MethodInvokeExpr(Expr * t, std::string_view m, gsl::span<Expr *> a)
  : target(t), method(m), args(a)
  {
  }
};

/// Binary expression.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r) : lhs(l), op(o), rhs(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// Local variable declaration: Type name = init;
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDeclStmt>
{
public:
  TypeRef * type;
  std::string_view name;
  Expr * initExpr = nullptr;

  VarDeclStmt(TypeRef * t, std::string_view n) : type(t), name(n) {}

  VarDeclStmt(TypeRef * t, std::string_view n, Expr * init) : type(t), name(n), initExpr(init) {}
};

/// Assignment statement: lhs = rhs;
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  Expr * lhs;
  Expr * rhs;

  AssignStmt(Expr * l, Expr * r) : lhs(l), rhs(r) {}
};

/// Expression evaluated for its side effects: expr;
class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e) : expr(e) {}
};

/// Conditional statement with optional else branch.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> trueStmts;
  gsl::span<Stmt *> falseStmts;

  explicit IfStmt(Expr * c) : condition(c) {}

  IfStmt(Expr * c, gsl::span<Stmt *> t) : condition(c), trueStmts(t) {}

  IfStmt(Expr * c, gsl::span<Stmt *> t, gsl::span<Stmt *> f)
  : condition(c), trueStmts(t), falseStmts(f)
  {
  }
};

/// return expr; (expr may be null for a bare return)
class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  ReturnStmt() = default;

  explicit ReturnStmt(Expr * v) : value(v) {}
};

// ============================================================================
// Class Member Nodes
// ============================================================================

/// Field declaration with optional initializer.
class FieldDecl : public NodeBase<FieldDecl, MemberDecl, NodeKind::FieldDecl>
{
public:
  TypeRef * type;
  Expr * initExpr = nullptr;

  FieldDecl(TypeRef * t, std::string_view n) : type(t) { name = n; }
};

/// Property declaration with get and/or set accessors.
class PropertyDecl : public NodeBase<PropertyDecl, MemberDecl, NodeKind::PropertyDecl>
{
public:
  TypeRef * type;
  bool hasGet = false;
  bool hasSet = false;
  gsl::span<Stmt *> getStmts;
  gsl::span<Stmt *> setStmts;

  PropertyDecl(TypeRef * t, std::string_view n) : type(t) { name = n; }
};

/// Method declaration. A null returnType means void.
class MethodDecl : public NodeBase<MethodDecl, MemberDecl, NodeKind::MethodDecl>
{
public:
  TypeRef * returnType = nullptr;
  gsl::span<ParamDecl *> params;
  gsl::span<Stmt *> body;

  explicit MethodDecl(std::string_view n) { name = n; }
};

// ============================================================================
// Top-level Nodes
// ============================================================================

/// Class declaration. Decorators append to `members`.
class ClassDecl : public NodeBase<ClassDecl, AstNode, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  MemberAccess access = MemberAccess::Public;
  bool isPartial = false;
  gsl::span<TypeRef *> baseTypes;
  gsl::span<MemberDecl *> members;
  gsl::span<std::string_view> docs;

  explicit ClassDecl(std::string_view n) : name(n) {}
};

/// Namespace holding imports and class declarations.
class NamespaceDecl : public NodeBase<NamespaceDecl, AstNode, NodeKind::NamespaceDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> imports;
  gsl::span<ClassDecl *> classes;

  explicit NamespaceDecl(std::string_view n) : name(n) {}
};

/// Root of a generated source file.
class CompileUnit : public NodeBase<CompileUnit, AstNode, NodeKind::CompileUnit>
{
public:
  gsl::span<NamespaceDecl *> namespaces;

  CompileUnit() = default;
};

}  // namespace apigen
