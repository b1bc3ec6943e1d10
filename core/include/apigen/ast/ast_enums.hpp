// apigen/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and member attributes used by the code-model AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace apigen
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "apigen/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "apigen/ast/ast_nodes.def"

// === Class members ===
#define AST_NODE_MEMBER(Class, Kind, Snake) Kind,
#include "apigen/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "apigen/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "apigen/ast/ast_nodes.def"
};

// ============================================================================
// Member attributes
// ============================================================================

/**
 * Accessibility of a type or class member.
 */
enum class MemberAccess : uint8_t {
  Private,
  Protected,
  Internal,
  Public,
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators available to generated code.
 */
enum class BinaryOp : uint8_t {
  IdentityEquality,    ///< reference equality (==)
  IdentityInequality,  ///< reference inequality (!=)
  ValueEquality,       ///< value equality (==)
  BooleanAnd,          ///< &&
  BooleanOr,           ///< ||
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(MemberAccess access) noexcept
{
  switch (access) {
    case MemberAccess::Private:
      return "private";
    case MemberAccess::Protected:
      return "protected";
    case MemberAccess::Internal:
      return "internal";
    case MemberAccess::Public:
      return "public";
  }
  return "";
}

/// Operator spelling as it appears in C#-family source.
[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::IdentityEquality:
    case BinaryOp::ValueEquality:
      return "==";
    case BinaryOp::IdentityInequality:
      return "!=";
    case BinaryOp::BooleanAnd:
      return "&&";
    case BinaryOp::BooleanOr:
      return "||";
  }
  return "";
}

/// Operator name, unambiguous between identity and value equality.
[[nodiscard]] constexpr std::string_view operator_name(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::IdentityEquality:
      return "IdentityEquality";
    case BinaryOp::IdentityInequality:
      return "IdentityInequality";
    case BinaryOp::ValueEquality:
      return "ValueEquality";
    case BinaryOp::BooleanAnd:
      return "BooleanAnd";
    case BinaryOp::BooleanOr:
      return "BooleanOr";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NullLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::BinaryExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::VarDeclStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ReturnStmt;

inline constexpr NodeKind k_first_member_kind = NodeKind::FieldDecl;
inline constexpr NodeKind k_last_member_kind = NodeKind::MethodDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a NodeKind is a class member declaration
[[nodiscard]] constexpr bool is_member_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_member_kind && kind <= detail::k_last_member_kind;
}

}  // namespace apigen
