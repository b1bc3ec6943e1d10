// apigen/decorator/object_to_json.cpp - ObjectToJson service decorator
//
#include "apigen/decorator/object_to_json.hpp"

#include <gsl/span>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_enums.hpp"
#include "apigen/ast/code_factory.hpp"

namespace apigen
{

FieldDecl * ObjectToJsonDecorator::create_serializer_field(CodeFactory & f) const
{
  auto * field =
    f.context().create<FieldDecl>(f.type(newtonsoft::k_serializer_type), f.name(names_.field));
  field->initExpr = f.null();
  field->access = MemberAccess::Private;
  return field;
}

gsl::span<Stmt *> ObjectToJsonDecorator::create_serializer_creation_block(CodeFactory & f) const
{
  // JsonSerializerSettings settings = new JsonSerializerSettings();
  auto * declare_settings = f.declare(
    newtonsoft::k_settings_type, names_.settingsVar,
    f.create_object(newtonsoft::k_settings_type));

  // settings.NullValueHandling = NullValueHandling.Ignore;
  auto * ignore_nulls = f.assign(
    f.property(f.var(names_.settingsVar), newtonsoft::k_null_value_handling),
    f.field(f.type_expr(newtonsoft::k_null_value_handling_type), newtonsoft::k_ignore));

  // this.newtonJsonSerilizer = JsonSerializer.Create(settings);
  auto * create_serializer = f.assign(
    f.this_field(names_.field),
    f.invoke(
      f.type_expr(newtonsoft::k_serializer_type), newtonsoft::k_create,
      {f.var(names_.settingsVar)}));

  return f.block({declare_settings, ignore_nulls, create_serializer});
}

PropertyDecl * ObjectToJsonDecorator::create_serializer_getter(CodeFactory & f) const
{
  auto * property = f.context().create<PropertyDecl>(
    f.type(newtonsoft::k_serializer_type), f.name(names_.property));
  property->access = MemberAccess::Private;
  property->hasGet = true;
  property->hasSet = false;

  // if (this.newtonJsonSerilizer == null) { ...creation block... }
  auto * condition =
    f.binary(f.this_field(names_.field), BinaryOp::IdentityEquality, f.null());
  auto * lazy_init = f.if_then(condition, create_serializer_creation_block(f));

  // return this.newtonJsonSerilizer;
  auto * return_field = f.ret(f.this_field(names_.field));

  property->getStmts = f.block({lazy_init, return_field});
  return property;
}

MethodDecl * ObjectToJsonDecorator::create_object_to_json(CodeFactory & f) const
{
  auto * method = f.context().create<MethodDecl>(f.name(names_.method));
  method->access = MemberAccess::Public;
  method->returnType = f.type(clr::k_string);
  method->params = f.context().copy_to_arena({f.param(clr::k_object, names_.param)});

  // TextWriter tw = new StringWriter();
  auto * declare_writer =
    f.declare(clr::k_text_writer, names_.writerVar, f.create_object(clr::k_string_writer));

  // this.NewtonJsonSerilizer.Serialize(tw, obj);
  // Goes through the accessor so the serializer exists before first use.
  auto * serialize = f.eval(f.invoke(
    f.this_property(names_.property), newtonsoft::k_serialize,
    {f.var(names_.writerVar), f.var(names_.param)}));

  // return tw.ToString();
  auto * return_text = f.ret(f.invoke(f.var(names_.writerVar), clr::k_to_string));

  method->body = f.block({declare_writer, serialize, return_text});
  return method;
}

void ObjectToJsonDecorator::decorate_class(
  const discovery::Service & /*service*/, ClassDecl & serviceClass, AstContext & ctx)
{
  CodeFactory f(ctx);
  f.add_member(serviceClass, create_serializer_field(f));
  f.add_member(serviceClass, create_serializer_getter(f));
  f.add_member(serviceClass, create_object_to_json(f));
}

}  // namespace apigen
