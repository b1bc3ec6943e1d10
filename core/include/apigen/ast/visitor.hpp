// apigen/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Type-safe AST traversal without virtual dispatch. Dispatch cases and the
// default visit methods are generated from ast_nodes.def.
//
#pragma once

#include <type_traits>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_enums.hpp"
#include "apigen/basic/casting.hpp"

namespace apigen
{

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements visit_<snake> methods for the node types it
 * cares about; everything else falls through to the category methods
 * (visit_expr, visit_stmt, visit_member) and finally visit_node.
 *
 * @code
 *   class FieldCounter : public ConstAstVisitor<FieldCounter, void> {
 *   public:
 *     void visit_field_decl(const FieldDecl*) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /**
   * Visit an AST node, dispatching to the appropriate visit method.
   */
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_MEMBER(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "apigen/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_MEMBER(Class, Kind, Snake)                                 \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_member(node);                                \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "apigen/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_member(detail::propagate_const_t<NodePtrT, MemberDecl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or skip it to prune the subtree.
 * Returning false stops the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  // --- Expressions ---

  bool visit_type_ref_expr(NodePtr<TypeRefExpr> node) { return get_derived().visit(node->type); }

  bool visit_field_ref_expr(NodePtr<FieldRefExpr> node)
  {
    return get_derived().visit(node->target);
  }

  bool visit_property_ref_expr(NodePtr<PropertyRefExpr> node)
  {
    return get_derived().visit(node->target);
  }

  bool visit_object_create_expr(NodePtr<ObjectCreateExpr> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_method_invoke_expr(NodePtr<MethodInvokeExpr> node)
  {
    if (node->target && !get_derived().visit(node->target)) return false;
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    if (!get_derived().visit(node->rhs)) return false;
    return true;
  }

  // --- Statements ---

  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node)
  {
    if (!get_derived().visit(node->type)) return false;
    if (node->initExpr && !get_derived().visit(node->initExpr)) return false;
    return true;
  }

  bool visit_assign_stmt(NodePtr<AssignStmt> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    for (auto * s : node->trueStmts) {
      if (!get_derived().visit(s)) return false;
    }
    for (auto * s : node->falseStmts) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  // --- Members ---

  bool visit_field_decl(NodePtr<FieldDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    return !node->initExpr || get_derived().visit(node->initExpr);
  }

  bool visit_property_decl(NodePtr<PropertyDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * s : node->getStmts) {
      if (!get_derived().visit(s)) return false;
    }
    for (auto * s : node->setStmts) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

  bool visit_method_decl(NodePtr<MethodDecl> node)
  {
    if (node->returnType && !get_derived().visit(node->returnType)) return false;
    for (auto * p : node->params) {
      if (!get_derived().visit(p)) return false;
    }
    for (auto * s : node->body) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

  // --- Supporting / top-level ---

  bool visit_type_ref(NodePtr<TypeRef> node)
  {
    for (auto * arg : node->typeArgs) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_param_decl(NodePtr<ParamDecl> node) { return get_derived().visit(node->type); }

  bool visit_class_decl(NodePtr<ClassDecl> node)
  {
    for (auto * base : node->baseTypes) {
      if (!get_derived().visit(base)) return false;
    }
    for (auto * m : node->members) {
      if (!get_derived().visit(m)) return false;
    }
    return true;
  }

  bool visit_namespace_decl(NodePtr<NamespaceDecl> node)
  {
    for (auto * c : node->classes) {
      if (!get_derived().visit(c)) return false;
    }
    return true;
  }

  bool visit_compile_unit(NodePtr<CompileUnit> node)
  {
    for (auto * ns : node->namespaces) {
      if (!get_derived().visit(ns)) return false;
    }
    return true;
  }

  // Leaf nodes that don't have children
  bool visit_null_literal_expr(NodePtr<NullLiteralExpr> /*node*/) { return true; }
  bool visit_bool_literal_expr(NodePtr<BoolLiteralExpr> /*node*/) { return true; }
  bool visit_int_literal_expr(NodePtr<IntLiteralExpr> /*node*/) { return true; }
  bool visit_string_literal_expr(NodePtr<StringLiteralExpr> /*node*/) { return true; }
  bool visit_this_ref_expr(NodePtr<ThisRefExpr> /*node*/) { return true; }
  bool visit_var_ref_expr(NodePtr<VarRefExpr> /*node*/) { return true; }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace apigen
