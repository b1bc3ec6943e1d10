// apigen/codegen/csharp_generator.cpp - C# source emitter
//
#include "apigen/codegen/csharp_generator.hpp"

#include <cstddef>
#include <gsl/span>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_enums.hpp"
#include "apigen/ast/visitor.hpp"

namespace apigen
{

namespace
{

[[nodiscard]] std::string quote_string(std::string_view s)
{
  std::string escaped;
  escaped.reserve(s.size() + 2);
  escaped.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"':
        escaped += "\\\"";
        break;
      case '\\':
        escaped += "\\\\";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      case '\0':
        escaped += "\\0";
        break;
      default:
        escaped.push_back(c);
    }
  }
  escaped.push_back('"');
  return escaped;
}

/// Text content of an XML doc comment.
[[nodiscard]] std::string xml_escape(std::string_view s)
{
  std::string escaped;
  escaped.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

/// C# keyword for a CLR type name, or the name itself.
[[nodiscard]] std::string_view csharp_type_name(std::string_view name)
{
  static const std::unordered_map<std::string_view, std::string_view> k_keywords = {
    {"System.Void", "void"},     {"System.Object", "object"}, {"System.String", "string"},
    {"System.Boolean", "bool"},  {"System.Int32", "int"},     {"System.Int64", "long"},
    {"System.Double", "double"}, {"System.Single", "float"},  {"System.Byte", "byte"},
    {"System.Char", "char"},     {"System.Decimal", "decimal"},
  };
  const auto it = k_keywords.find(name);
  if (it != k_keywords.end()) {
    return it->second;
  }
  // Generic CLR names carry an arity suffix (List`1); C# spells arguments instead.
  const auto tick = name.find('`');
  return tick == std::string_view::npos ? name : name.substr(0, tick);
}

[[nodiscard]] std::string render_args(gsl::span<Expr *> args)
{
  std::string out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += CSharpGenerator::render_expr(args[i]);
  }
  return out;
}

// ============================================================================
// Statement / declaration writer
// ============================================================================

class CSharpWriter : public ConstAstVisitor<CSharpWriter, void>
{
public:
  explicit CSharpWriter(const CSharpOptions & options) : options_(options) {}

  [[nodiscard]] std::string str() const { return out_.str(); }

  // --- Top-level ---

  void visit_compile_unit(const CompileUnit * node)
  {
    if (options_.emitBanner) {
      line("//------------------------------------------------------------------------------");
      line("// <auto-generated>");
      line("//     This code was generated by apigen.");
      line("//");
      line("//     Changes to this file may cause incorrect behavior and will be lost if");
      line("//     the code is regenerated.");
      line("// </auto-generated>");
      line("//------------------------------------------------------------------------------");
      blank();
    }
    for (std::size_t i = 0; i < node->namespaces.size(); ++i) {
      if (i > 0) blank();
      visit(node->namespaces[i]);
    }
  }

  void visit_namespace_decl(const NamespaceDecl * node)
  {
    line("namespace " + std::string(node->name));
    open_block();
    for (const auto imported : node->imports) {
      line("using " + std::string(imported) + ";");
    }
    if (!node->imports.empty() && !node->classes.empty()) blank();
    for (std::size_t i = 0; i < node->classes.size(); ++i) {
      if (i > 0) blank();
      visit(node->classes[i]);
    }
    close_block();
  }

  void visit_class_decl(const ClassDecl * node)
  {
    if (!node->docs.empty()) {
      line("/// <summary>");
      for (const auto doc : node->docs) {
        line("/// " + xml_escape(doc));
      }
      line("/// </summary>");
    }

    std::string header(to_string(node->access));
    if (node->isPartial) header += " partial";
    header += " class " + std::string(node->name);
    for (std::size_t i = 0; i < node->baseTypes.size(); ++i) {
      header += (i == 0) ? " : " : ", ";
      header += CSharpGenerator::render_type(node->baseTypes[i]);
    }
    line(header);
    open_block();
    for (std::size_t i = 0; i < node->members.size(); ++i) {
      if (i > 0) blank();
      visit(node->members[i]);
    }
    close_block();
  }

  // --- Members ---

  void visit_field_decl(const FieldDecl * node)
  {
    std::string text = modifiers(node) + CSharpGenerator::render_type(node->type) + " " +
                       std::string(node->name);
    if (node->initExpr) {
      text += " = " + CSharpGenerator::render_expr(node->initExpr);
    }
    line(text + ";");
  }

  void visit_property_decl(const PropertyDecl * node)
  {
    line(modifiers(node) + CSharpGenerator::render_type(node->type) + " " + std::string(node->name));
    open_block();
    if (node->hasGet) {
      line("get");
      write_block(node->getStmts);
    }
    if (node->hasSet) {
      line("set");
      write_block(node->setStmts);
    }
    close_block();
  }

  void visit_method_decl(const MethodDecl * node)
  {
    std::string params;
    for (std::size_t i = 0; i < node->params.size(); ++i) {
      if (i > 0) params += ", ";
      const auto * p = node->params[i];
      params += CSharpGenerator::render_type(p->type) + " " + std::string(p->name);
    }
    line(
      modifiers(node) + CSharpGenerator::render_type(node->returnType) + " " +
      std::string(node->name) + "(" + params + ")");
    write_block(node->body);
  }

  // --- Statements ---

  void visit_var_decl_stmt(const VarDeclStmt * node)
  {
    std::string text = CSharpGenerator::render_type(node->type) + " " + std::string(node->name);
    if (node->initExpr) {
      text += " = " + CSharpGenerator::render_expr(node->initExpr);
    }
    line(text + ";");
  }

  void visit_assign_stmt(const AssignStmt * node)
  {
    line(CSharpGenerator::render_expr(node->lhs) + " = " + CSharpGenerator::render_expr(node->rhs) + ";");
  }

  void visit_expr_stmt(const ExprStmt * node)
  {
    line(CSharpGenerator::render_expr(node->expr) + ";");
  }

  void visit_if_stmt(const IfStmt * node)
  {
    line("if (" + CSharpGenerator::render_expr(node->condition) + ")");
    write_block(node->trueStmts);
    if (!node->falseStmts.empty()) {
      line("else");
      write_block(node->falseStmts);
    }
  }

  void visit_return_stmt(const ReturnStmt * node)
  {
    if (node->value) {
      line("return " + CSharpGenerator::render_expr(node->value) + ";");
    } else {
      line("return;");
    }
  }

private:
  const CSharpOptions & options_;
  std::ostringstream out_;
  std::size_t depth_ = 0;

  [[nodiscard]] static std::string modifiers(const MemberDecl * node)
  {
    std::string text(to_string(node->access));
    text += node->isStatic ? " static " : " ";
    return text;
  }

  void line(const std::string & text)
  {
    out_ << std::string(depth_ * options_.indentWidth, ' ') << text
         << "\n";
  }

  void blank() { out_ << "\n"; }

  void open_block()
  {
    line("{");
    ++depth_;
  }

  void close_block()
  {
    --depth_;
    line("}");
  }

  void write_block(gsl::span<Stmt *> stmts)
  {
    open_block();
    for (const auto * s : stmts) {
      visit(s);
    }
    close_block();
  }
};

}  // namespace

// ============================================================================
// CSharpGenerator
// ============================================================================

std::string CSharpGenerator::render_type(const TypeRef * type)
{
  if (!type) {
    return "void";
  }
  std::string out(csharp_type_name(type->name));
  if (!type->typeArgs.empty()) {
    out += "<";
    for (std::size_t i = 0; i < type->typeArgs.size(); ++i) {
      if (i > 0) out += ", ";
      out += render_type(type->typeArgs[i]);
    }
    out += ">";
  }
  return out;
}

std::string CSharpGenerator::render_expr(const Expr * expr)
{
  if (!expr) {
    return {};
  }

  switch (expr->get_kind()) {
    case NodeKind::NullLiteral:
      return "null";
    case NodeKind::BoolLiteral:
      return static_cast<const BoolLiteralExpr *>(expr)->value ? "true" : "false";
    case NodeKind::IntLiteral:
      return std::to_string(static_cast<const IntLiteralExpr *>(expr)->value);
    case NodeKind::StringLiteral:
      return quote_string(static_cast<const StringLiteralExpr *>(expr)->value);
    case NodeKind::ThisRef:
      return "this";
    case NodeKind::VarRef:
      return std::string(static_cast<const VarRefExpr *>(expr)->name);
    case NodeKind::TypeRefExpr:
      return render_type(static_cast<const TypeRefExpr *>(expr)->type);
    case NodeKind::FieldRef: {
      const auto * f = static_cast<const FieldRefExpr *>(expr);
      return render_expr(f->target) + "." + std::string(f->name);
    }
    case NodeKind::PropertyRef: {
      const auto * p = static_cast<const PropertyRefExpr *>(expr);
      return render_expr(p->target) + "." + std::string(p->name);
    }
    case NodeKind::ObjectCreate: {
      const auto * c = static_cast<const ObjectCreateExpr *>(expr);
      return "new " + render_type(c->type) + "(" + render_args(c->args) + ")";
    }
    case NodeKind::MethodInvoke: {
      const auto * call = static_cast<const MethodInvokeExpr *>(expr);
      std::string out;
      if (call->target) {
        out = render_expr(call->target) + ".";
      }
      return out + std::string(call->method) + "(" + render_args(call->args) + ")";
    }
    case NodeKind::BinaryExpr: {
      const auto * b = static_cast<const BinaryExpr *>(expr);
      return "(" + render_expr(b->lhs) + " " + std::string(to_string(b->op)) + " " +
             render_expr(b->rhs) + ")";
    }
    default:
      break;
  }

  return {};
}

std::string CSharpGenerator::generate(const CompileUnit & unit) const
{
  CSharpWriter writer(options_);
  writer.visit(&unit);
  return writer.str();
}

std::string CSharpGenerator::generate(const ClassDecl & cls) const
{
  CSharpWriter writer(options_);
  writer.visit(&cls);
  return writer.str();
}

std::string CSharpGenerator::generate_member(const MemberDecl & member) const
{
  CSharpWriter writer(options_);
  writer.visit(&member);
  return writer.str();
}

std::string CSharpGenerator::generate_statement(const Stmt & stmt) const
{
  CSharpWriter writer(options_);
  writer.visit(&stmt);
  return writer.str();
}

}  // namespace apigen
