// apigen/ast/ast_dumper.hpp - Debug AST tree output
//
// Dumps code-model AST nodes in a human-readable tree format, used by
// `apigen generate --dump-ast` and by tests.
//
#pragma once

#include <gsl/span>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_enums.hpp"
#include "apigen/ast/visitor.hpp"

namespace apigen
{

// ============================================================================
// AstDumper - Debug AST output
// ============================================================================

/**
 * Dumps AST nodes in a human-readable tree format.
 *
 * @code
 *   ClassDecl name='PlusService' public
 *   |-FieldDecl name='newtonJsonSerilizer' private
 *   | |-TypeRef name='Newtonsoft.Json.JsonSerializer'
 *   | `-NullLiteralExpr
 *   `-MethodDecl name='ObjectToJson' public
 *     ...
 * @endcode
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  /// Dump an AST node and its subtree. The root is printed without a marker.
  void dump(const AstNode * node)
  {
    atRoot_ = true;
    visit(node);
  }

  // ===========================================================================
  // Generic tree printer
  // ===========================================================================

  /// Property for display: either key='value' or a bare value
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}
  };

  template <typename... Containers>
  void print_tree(
    std::string_view label, const std::vector<Prop> & props, const Containers &... childContainers)
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    os_ << "\n";

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, childContainers), ...);

    if (!all_children.empty()) {
      const IndentScope scope(*this);
      for (size_t i = 0; i < all_children.size(); ++i) {
        isLast_ = (i == all_children.size() - 1);
        visit(all_children[i]);
      }
    }
  }

  template <typename... Containers>
  void print_tree(
    std::string_view label, std::initializer_list<Prop> props, const Containers &... childContainers)
  {
    print_tree(label, std::vector<Prop>(props), childContainers...);
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  // --- Top-level ---
  void visit_compile_unit(const CompileUnit * node) { print_tree("CompileUnit", {}, node->namespaces); }
  void visit_namespace_decl(const NamespaceDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    for (const auto import : node->imports) {
      props.emplace_back("using", import);
    }
    print_tree("NamespaceDecl", props, node->classes);
  }
  void visit_class_decl(const ClassDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}, {to_string(node->access)}};
    if (node->isPartial) props.emplace_back("partial");
    print_tree("ClassDecl", props, node->baseTypes, node->members);
  }

  // --- Members ---
  void visit_field_decl(const FieldDecl * node)
  {
    print_tree("FieldDecl", member_props(node), node->type, node->initExpr);
  }
  void visit_property_decl(const PropertyDecl * node)
  {
    std::vector<Prop> props = member_props(node);
    if (node->hasGet) props.emplace_back("[get]");
    if (node->hasSet) props.emplace_back("[set]");
    print_tree("PropertyDecl", props, node->type, node->getStmts, node->setStmts);
  }
  void visit_method_decl(const MethodDecl * node)
  {
    print_tree("MethodDecl", member_props(node), node->returnType, node->params, node->body);
  }

  // --- Supporting nodes ---
  void visit_type_ref(const TypeRef * node)
  {
    print_tree("TypeRef", {{"name", node->name}}, node->typeArgs);
  }
  void visit_param_decl(const ParamDecl * node)
  {
    print_tree("ParamDecl", {{"name", node->name}}, node->type);
  }

  // --- Statements ---
  void visit_var_decl_stmt(const VarDeclStmt * node)
  {
    print_tree("VarDeclStmt", {{"name", node->name}}, node->type, node->initExpr);
  }
  void visit_assign_stmt(const AssignStmt * node)
  {
    print_tree("AssignStmt", {}, node->lhs, node->rhs);
  }
  void visit_expr_stmt(const ExprStmt * node) { print_tree("ExprStmt", {}, node->expr); }
  void visit_if_stmt(const IfStmt * node)
  {
    std::vector<Prop> props;
    if (!node->falseStmts.empty()) props.emplace_back("[else]");
    print_tree("IfStmt", props, node->condition, node->trueStmts, node->falseStmts);
  }
  void visit_return_stmt(const ReturnStmt * node) { print_tree("ReturnStmt", {}, node->value); }

  // --- Expressions ---
  void visit_null_literal_expr(const NullLiteralExpr * /*node*/)
  {
    print_tree("NullLiteralExpr", {});
  }
  void visit_bool_literal_expr(const BoolLiteralExpr * node)
  {
    print_tree("BoolLiteralExpr", {Prop(node->value ? "true" : "false")});
  }
  void visit_int_literal_expr(const IntLiteralExpr * node)
  {
    print_tree("IntLiteralExpr", {Prop(std::to_string(node->value))});
  }
  void visit_string_literal_expr(const StringLiteralExpr * node)
  {
    print_tree("StringLiteralExpr", {Prop("\"" + std::string(node->value) + "\"")});
  }
  void visit_this_ref_expr(const ThisRefExpr * /*node*/) { print_tree("ThisRefExpr", {}); }
  void visit_var_ref_expr(const VarRefExpr * node)
  {
    print_tree("VarRefExpr", {{"name", node->name}});
  }
  void visit_type_ref_expr(const TypeRefExpr * node)
  {
    print_tree("TypeRefExpr", {}, node->type);
  }
  void visit_field_ref_expr(const FieldRefExpr * node)
  {
    print_tree("FieldRefExpr", {{"name", node->name}}, node->target);
  }
  void visit_property_ref_expr(const PropertyRefExpr * node)
  {
    print_tree("PropertyRefExpr", {{"name", node->name}}, node->target);
  }
  void visit_object_create_expr(const ObjectCreateExpr * node)
  {
    print_tree("ObjectCreateExpr", {}, node->type, node->args);
  }
  void visit_method_invoke_expr(const MethodInvokeExpr * node)
  {
    print_tree("MethodInvokeExpr", {{"method", node->method}}, node->target, node->args);
  }
  void visit_binary_expr(const BinaryExpr * node)
  {
    print_tree("BinaryExpr", {{"op", operator_name(node->op)}}, node->lhs, node->rhs);
  }

private:
  std::ostream & os_;
  std::string prefix_;
  bool isLast_ = true;
  bool atRoot_ = true;

  static std::vector<Prop> member_props(const MemberDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}, {to_string(node->access)}};
    if (node->isStatic) props.emplace_back("static");
    return props;
  }

  // --- Helper: extract children based on type ---

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, T * ptr)
  {
    if (ptr) out.push_back(ptr);
  }

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, gsl::span<T *> span)
  {
    for (auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  // --- Rendering ---

  void print_prefix()
  {
    if (atRoot_) {
      return;
    }
    os_ << prefix_;
    os_ << (isLast_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;
    bool savedRoot;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_), savedRoot(d.atRoot_)
    {
      // Children of the root start at column 0 with their tree markers.
      if (!d.atRoot_) {
        d.prefix_ += d.isLast_ ? "  " : "| ";
      }
      d.atRoot_ = false;
    }

    ~IndentScope()
    {
      d.prefix_ = saved;
      d.atRoot_ = savedRoot;
    }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Dump an AST node to the given output stream.
inline void dump(const AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

/// Dump an AST node to a string.
inline std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace apigen
