// test_csharp_generator.cpp - Unit tests for C# source rendering
//
#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include "apigen/ast/code_factory.hpp"
#include "apigen/codegen/csharp_generator.hpp"
#include "apigen/decorator/object_to_json.hpp"
#include "apigen/test_support/service_helpers.hpp"

namespace apigen
{

static void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos)
    << "Expected to find: " << needle << "\nIn output:\n"
    << haystack;
}

static void expect_not_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_EQ(haystack.find(needle), std::string::npos)
    << "Expected NOT to find: " << needle << "\nIn output:\n"
    << haystack;
}

class CSharpGeneratorTest : public ::testing::Test
{
protected:
  AstContext ctx_;
  CodeFactory f_{ctx_};
  CSharpGenerator gen_;
};

// ============================================================================
// Types and expressions
// ============================================================================

TEST_F(CSharpGeneratorTest, BuiltinTypesUseKeywords)
{
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.String")), "string");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.Object")), "object");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.Boolean")), "bool");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.Int32")), "int");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.Int64")), "long");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.Void")), "void");
  EXPECT_EQ(CSharpGenerator::render_type(nullptr), "void");
}

TEST_F(CSharpGeneratorTest, OtherTypesStayQualified)
{
  EXPECT_EQ(
    CSharpGenerator::render_type(f_.type("Newtonsoft.Json.JsonSerializer")),
    "Newtonsoft.Json.JsonSerializer");
  EXPECT_EQ(CSharpGenerator::render_type(f_.type("System.IO.TextWriter")), "System.IO.TextWriter");
}

TEST_F(CSharpGeneratorTest, GenericTypes)
{
  auto * t = f_.generic_type(
    "System.Collections.Generic.Dictionary`2", {f_.type("System.String"), f_.type("System.Int32")});
  EXPECT_EQ(CSharpGenerator::render_type(t), "System.Collections.Generic.Dictionary<string, int>");
}

TEST_F(CSharpGeneratorTest, Literals)
{
  EXPECT_EQ(CSharpGenerator::render_expr(f_.null()), "null");
  EXPECT_EQ(CSharpGenerator::render_expr(f_.bool_literal(true)), "true");
  EXPECT_EQ(CSharpGenerator::render_expr(f_.bool_literal(false)), "false");
  EXPECT_EQ(CSharpGenerator::render_expr(f_.int_literal(-17)), "-17");
  EXPECT_EQ(
    CSharpGenerator::render_expr(f_.string_literal("say \"hi\"\n\\")), "\"say \\\"hi\\\"\\n\\\\\"");
}

TEST_F(CSharpGeneratorTest, MemberAccessAndCalls)
{
  EXPECT_EQ(CSharpGenerator::render_expr(f_.this_field("x")), "this.x");
  EXPECT_EQ(CSharpGenerator::render_expr(f_.property(f_.var("s"), "Length")), "s.Length");
  auto * max = f_.invoke(f_.type_expr("System.Math"), "Max", {f_.int_literal(1), f_.int_literal(2)});
  EXPECT_EQ(CSharpGenerator::render_expr(max), "System.Math.Max(1, 2)");
  EXPECT_EQ(CSharpGenerator::render_expr(f_.invoke(nullptr, "Init")), "Init()");
  EXPECT_EQ(
    CSharpGenerator::render_expr(f_.create_object("System.IO.StringWriter")),
    "new System.IO.StringWriter()");
}

TEST_F(CSharpGeneratorTest, BinaryIsParenthesized)
{
  auto * e = f_.binary(
    f_.binary(f_.this_field("a"), BinaryOp::IdentityEquality, f_.null()), BinaryOp::BooleanOr,
    f_.binary(f_.var("b"), BinaryOp::IdentityInequality, f_.null()));
  EXPECT_EQ(CSharpGenerator::render_expr(e), "((this.a == null) || (b != null))");
}

// ============================================================================
// Statements and members
// ============================================================================

TEST_F(CSharpGeneratorTest, Statements)
{
  EXPECT_EQ(
    gen_.generate_statement(*f_.declare("System.Int32", "n", f_.int_literal(0))), "int n = 0;\n");
  EXPECT_EQ(gen_.generate_statement(*f_.declare("System.Int32", "n")), "int n;\n");
  EXPECT_EQ(gen_.generate_statement(*f_.assign(f_.var("n"), f_.int_literal(1))), "n = 1;\n");
  EXPECT_EQ(gen_.generate_statement(*f_.eval(f_.invoke(f_.var("w"), "Flush"))), "w.Flush();\n");
  EXPECT_EQ(gen_.generate_statement(*f_.ret()), "return;\n");
}

TEST_F(CSharpGeneratorTest, IfElse)
{
  auto * stmt = f_.if_then(f_.var("ok"), f_.block({f_.ret(f_.int_literal(1))}));
  stmt->falseStmts = f_.block({f_.ret(f_.int_literal(0))});

  const std::string expected =
    "if (ok)\n"
    "{\n"
    "    return 1;\n"
    "}\n"
    "else\n"
    "{\n"
    "    return 0;\n"
    "}\n";
  EXPECT_EQ(gen_.generate_statement(*stmt), expected);
}

TEST_F(CSharpGeneratorTest, SerializerField)
{
  ObjectToJsonDecorator decorator;
  EXPECT_EQ(
    gen_.generate_member(*decorator.create_serializer_field(f_)),
    "private Newtonsoft.Json.JsonSerializer newtonJsonSerilizer = null;\n");
}

TEST_F(CSharpGeneratorTest, StaticMethodWithParams)
{
  auto * m = ctx_.create<MethodDecl>(f_.name("Add"));
  m->access = MemberAccess::Internal;
  m->isStatic = true;
  m->returnType = f_.type("System.Int32");
  m->params = ctx_.copy_to_arena({f_.param("System.Int32", "a"), f_.param("System.Int32", "b")});
  m->body = f_.block({f_.ret(f_.var("a"))});

  const std::string expected =
    "internal static int Add(int a, int b)\n"
    "{\n"
    "    return a;\n"
    "}\n";
  EXPECT_EQ(gen_.generate_member(*m), expected);
}

TEST_F(CSharpGeneratorTest, GetSetProperty)
{
  auto * p = ctx_.create<PropertyDecl>(f_.type("System.String"), f_.name("Name"));
  p->access = MemberAccess::Public;
  p->hasGet = true;
  p->hasSet = true;
  p->getStmts = f_.block({f_.ret(f_.this_field("name"))});
  p->setStmts = f_.block({f_.assign(f_.this_field("name"), f_.var("value"))});

  const std::string expected =
    "public string Name\n"
    "{\n"
    "    get\n"
    "    {\n"
    "        return this.name;\n"
    "    }\n"
    "    set\n"
    "    {\n"
    "        this.name = value;\n"
    "    }\n"
    "}\n";
  EXPECT_EQ(gen_.generate_member(*p), expected);
}

// ============================================================================
// Decorated class
// ============================================================================

TEST_F(CSharpGeneratorTest, DecoratedServiceClass)
{
  auto unit = test_support::make_service_class("plus");
  ObjectToJsonDecorator decorator;
  decorator.decorate_class(unit.service, *unit.serviceClass, *unit.ast);

  const std::string got = gen_.generate(*unit.serviceClass);

  const std::string expected =
    "public class PlusService\n"
    "{\n"
    "    private Newtonsoft.Json.JsonSerializer newtonJsonSerilizer = null;\n"
    "\n"
    "    private Newtonsoft.Json.JsonSerializer NewtonJsonSerilizer\n"
    "    {\n"
    "        get\n"
    "        {\n"
    "            if ((this.newtonJsonSerilizer == null))\n"
    "            {\n"
    "                Newtonsoft.Json.JsonSerializerSettings settings = new "
    "Newtonsoft.Json.JsonSerializerSettings();\n"
    "                settings.NullValueHandling = Newtonsoft.Json.NullValueHandling.Ignore;\n"
    "                this.newtonJsonSerilizer = Newtonsoft.Json.JsonSerializer.Create(settings);\n"
    "            }\n"
    "            return this.newtonJsonSerilizer;\n"
    "        }\n"
    "    }\n"
    "\n"
    "    public string ObjectToJson(object obj)\n"
    "    {\n"
    "        System.IO.TextWriter tw = new System.IO.StringWriter();\n"
    "        this.NewtonJsonSerilizer.Serialize(tw, obj);\n"
    "        return tw.ToString();\n"
    "    }\n"
    "}\n";

  EXPECT_EQ(got, expected);
  expect_not_contains(got, "this.Serialize(");
}

TEST_F(CSharpGeneratorTest, CompileUnitWithBannerAndDocs)
{
  auto * cls = ctx_.create<ClassDecl>(f_.name("BooksService"));
  cls->isPartial = true;
  cls->docs = ctx_.copy_to_arena({f_.name("Lets you search for books.")});
  cls->baseTypes = ctx_.copy_to_arena({f_.type("System.IDisposable")});
  auto * ns = ctx_.create<NamespaceDecl>(f_.name("Google.Apis.Books.v1"));
  ns->imports = ctx_.copy_to_arena({f_.name("System")});
  ns->classes = ctx_.copy_to_arena({cls});
  auto * cu = ctx_.create<CompileUnit>();
  cu->namespaces = ctx_.copy_to_arena({ns});

  const std::string got = gen_.generate(*cu);

  expect_contains(got, "// <auto-generated>\n");
  expect_contains(
    got,
    "namespace Google.Apis.Books.v1\n"
    "{\n"
    "    using System;\n"
    "\n"
    "    /// <summary>\n"
    "    /// Lets you search for books.\n"
    "    /// </summary>\n"
    "    public partial class BooksService : System.IDisposable\n"
    "    {\n"
    "    }\n"
    "}\n");
}

TEST_F(CSharpGeneratorTest, BannerCanBeDisabled)
{
  CSharpOptions options;
  options.emitBanner = false;
  options.indentWidth = 2;
  const CSharpGenerator gen(options);

  auto * ns = ctx_.create<NamespaceDecl>(f_.name("A"));
  auto * cls = ctx_.create<ClassDecl>(f_.name("B"));
  f_.add_member(*cls, ctx_.create<FieldDecl>(f_.type("System.Int32"), f_.name("c")));
  ns->classes = ctx_.copy_to_arena({cls});
  auto * cu = ctx_.create<CompileUnit>();
  cu->namespaces = ctx_.copy_to_arena({ns});

  const std::string expected =
    "namespace A\n"
    "{\n"
    "  public class B\n"
    "  {\n"
    "    private int c;\n"
    "  }\n"
    "}\n";
  EXPECT_EQ(gen.generate(*cu), expected);
}

TEST_F(CSharpGeneratorTest, DocCommentsAreXmlEscaped)
{
  auto * cls = ctx_.create<ClassDecl>(f_.name("BooksService"));
  cls->docs = ctx_.copy_to_arena({f_.name("Read & write <b>books</b>"), f_.name("a -> b")});

  const std::string got = gen_.generate(*cls);

  expect_contains(
    got,
    "/// <summary>\n"
    "/// Read &amp; write &lt;b&gt;books&lt;/b&gt;\n"
    "/// a -&gt; b\n"
    "/// </summary>\n");
  expect_not_contains(got, "<b>");
}

TEST_F(CSharpGeneratorTest, ZeroIndentWidth)
{
  static_assert(
    std::is_unsigned_v<decltype(CSharpOptions::indentWidth)>,
    "indent width cannot be negative");

  CSharpOptions options;
  options.emitBanner = false;
  options.indentWidth = 0;
  const CSharpGenerator gen(options);

  auto * cls = ctx_.create<ClassDecl>(f_.name("B"));
  f_.add_member(*cls, ctx_.create<FieldDecl>(f_.type("System.Int32"), f_.name("c")));

  const std::string expected =
    "public class B\n"
    "{\n"
    "private int c;\n"
    "}\n";
  EXPECT_EQ(gen.generate(*cls), expected);
}

}  // namespace apigen
