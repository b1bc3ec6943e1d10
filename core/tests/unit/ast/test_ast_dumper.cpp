// test_ast_dumper.cpp - Tree dumps of decorated service classes
//
#include <gtest/gtest.h>

#include <string>

#include "apigen/ast/ast_dumper.hpp"
#include "apigen/ast/code_factory.hpp"
#include "apigen/decorator/object_to_json.hpp"
#include "apigen/test_support/service_helpers.hpp"

namespace apigen
{

TEST(DumpAst, SerializerField)
{
  AstContext ctx;
  CodeFactory f(ctx);
  ObjectToJsonDecorator decorator;

  const std::string got = dump_to_string(decorator.create_serializer_field(f));

  const std::string expected =
    "FieldDecl name='newtonJsonSerilizer' private\n"
    "|-TypeRef name='Newtonsoft.Json.JsonSerializer'\n"
    "`-NullLiteralExpr\n";

  EXPECT_EQ(got, expected);
}

TEST(DumpAst, SerializerGetter)
{
  AstContext ctx;
  CodeFactory f(ctx);
  ObjectToJsonDecorator decorator;

  const std::string got = dump_to_string(decorator.create_serializer_getter(f));

  const std::string expected =
    "PropertyDecl name='NewtonJsonSerilizer' private [get]\n"
    "|-TypeRef name='Newtonsoft.Json.JsonSerializer'\n"
    "|-IfStmt\n"
    "| |-BinaryExpr op='IdentityEquality'\n"
    "| | |-FieldRefExpr name='newtonJsonSerilizer'\n"
    "| | | `-ThisRefExpr\n"
    "| | `-NullLiteralExpr\n"
    "| |-VarDeclStmt name='settings'\n"
    "| | |-TypeRef name='Newtonsoft.Json.JsonSerializerSettings'\n"
    "| | `-ObjectCreateExpr\n"
    "| |   `-TypeRef name='Newtonsoft.Json.JsonSerializerSettings'\n"
    "| |-AssignStmt\n"
    "| | |-PropertyRefExpr name='NullValueHandling'\n"
    "| | | `-VarRefExpr name='settings'\n"
    "| | `-FieldRefExpr name='Ignore'\n"
    "| |   `-TypeRefExpr\n"
    "| |     `-TypeRef name='Newtonsoft.Json.NullValueHandling'\n"
    "| `-AssignStmt\n"
    "|   |-FieldRefExpr name='newtonJsonSerilizer'\n"
    "|   | `-ThisRefExpr\n"
    "|   `-MethodInvokeExpr method='Create'\n"
    "|     |-TypeRefExpr\n"
    "|     | `-TypeRef name='Newtonsoft.Json.JsonSerializer'\n"
    "|     `-VarRefExpr name='settings'\n"
    "`-ReturnStmt\n"
    "  `-FieldRefExpr name='newtonJsonSerilizer'\n"
    "    `-ThisRefExpr\n";

  EXPECT_EQ(got, expected);
}

TEST(DumpAst, ObjectToJsonMethod)
{
  AstContext ctx;
  CodeFactory f(ctx);
  ObjectToJsonDecorator decorator;

  const std::string got = dump_to_string(decorator.create_object_to_json(f));

  const std::string expected =
    "MethodDecl name='ObjectToJson' public\n"
    "|-TypeRef name='System.String'\n"
    "|-ParamDecl name='obj'\n"
    "| `-TypeRef name='System.Object'\n"
    "|-VarDeclStmt name='tw'\n"
    "| |-TypeRef name='System.IO.TextWriter'\n"
    "| `-ObjectCreateExpr\n"
    "|   `-TypeRef name='System.IO.StringWriter'\n"
    "|-ExprStmt\n"
    "| `-MethodInvokeExpr method='Serialize'\n"
    "|   |-PropertyRefExpr name='NewtonJsonSerilizer'\n"
    "|   | `-ThisRefExpr\n"
    "|   |-VarRefExpr name='tw'\n"
    "|   `-VarRefExpr name='obj'\n"
    "`-ReturnStmt\n"
    "  `-MethodInvokeExpr method='ToString'\n"
    "    `-VarRefExpr name='tw'\n";

  EXPECT_EQ(got, expected);
}

TEST(DumpAst, DecoratedClassOutline)
{
  auto unit = test_support::make_service_class("plus");
  ObjectToJsonDecorator decorator;
  decorator.decorate_class(unit.service, *unit.serviceClass, *unit.ast);

  const std::string got = dump_to_string(unit.serviceClass);

  EXPECT_EQ(got.rfind("ClassDecl name='PlusService' public\n", 0), 0u) << got;
  EXPECT_NE(got.find("\n|-FieldDecl name='newtonJsonSerilizer' private\n"), std::string::npos);
  EXPECT_NE(
    got.find("\n|-PropertyDecl name='NewtonJsonSerilizer' private [get]\n"), std::string::npos);
  EXPECT_NE(got.find("\n`-MethodDecl name='ObjectToJson' public\n"), std::string::npos);
  // Members below the root are indented one level
  EXPECT_NE(got.find("\n| |-TypeRef name='Newtonsoft.Json.JsonSerializer'\n"), std::string::npos);
  EXPECT_NE(got.find("\n  |-ParamDecl name='obj'\n"), std::string::npos);
}

TEST(DumpAst, LiteralsAndElse)
{
  AstContext ctx;
  CodeFactory f(ctx);

  auto * stmt = ctx.create<IfStmt>(
    f.binary(f.var("a"), BinaryOp::BooleanAnd, f.bool_literal(false)),
    f.block({f.ret(f.string_literal("yes"))}));
  stmt->falseStmts = f.block({f.ret(f.int_literal(-2))});

  const std::string got = dump_to_string(stmt);

  const std::string expected =
    "IfStmt [else]\n"
    "|-BinaryExpr op='BooleanAnd'\n"
    "| |-VarRefExpr name='a'\n"
    "| `-BoolLiteralExpr false\n"
    "|-ReturnStmt\n"
    "| `-StringLiteralExpr \"yes\"\n"
    "`-ReturnStmt\n"
    "  `-IntLiteralExpr -2\n";

  EXPECT_EQ(got, expected);
}

TEST(DumpAst, CompileUnit)
{
  AstContext ctx;
  auto * cls = ctx.create<ClassDecl>(ctx.intern("BooksService"));
  cls->isPartial = true;
  auto * ns = ctx.create<NamespaceDecl>(ctx.intern("Google.Apis.Books.v1"));
  ns->classes = ctx.copy_to_arena({cls});
  auto * cu = ctx.create<CompileUnit>();
  cu->namespaces = ctx.copy_to_arena({ns});

  const std::string expected =
    "CompileUnit\n"
    "`-NamespaceDecl name='Google.Apis.Books.v1'\n"
    "  `-ClassDecl name='BooksService' public partial\n";

  EXPECT_EQ(dump_to_string(cu), expected);
}

}  // namespace apigen
