// apigen/decorator/object_to_json.hpp - ObjectToJson service decorator
//
// Gives the generated service class an `ObjectToJson` method backed by
// Newtonsoft.Json:
//
//   private Newtonsoft.Json.JsonSerializer newtonJsonSerilizer = null;
//
//   private Newtonsoft.Json.JsonSerializer NewtonJsonSerilizer
//   {
//       get
//       {
//           if ((this.newtonJsonSerilizer == null))
//           {
//               Newtonsoft.Json.JsonSerializerSettings settings = new Newtonsoft.Json.JsonSerializerSettings();
//               settings.NullValueHandling = Newtonsoft.Json.NullValueHandling.Ignore;
//               this.newtonJsonSerilizer = Newtonsoft.Json.JsonSerializer.Create(settings);
//           }
//           return this.newtonJsonSerilizer;
//       }
//   }
//
//   public string ObjectToJson(object obj)
//   {
//       System.IO.TextWriter tw = new System.IO.StringWriter();
//       this.NewtonJsonSerilizer.Serialize(tw, obj);
//       return tw.ToString();
//   }
//
// The accessor initializes the serializer without synchronization: generated
// classes must not race on their first ObjectToJson call.
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <utility>

#include "apigen/ast/ast.hpp"
#include "apigen/ast/ast_context.hpp"
#include "apigen/ast/code_factory.hpp"
#include "apigen/decorator/service_decorator.hpp"
#include "apigen/discovery/service.hpp"

namespace apigen
{

/**
 * Member and local names shared by the field, accessor and method builders.
 *
 * The accessor refers to the field by `field`, and the method refers to the
 * accessor by `property`; the defaults are the published names other
 * generated code relies on (spelling included).
 */
struct SerializerNames
{
  std::string field = "newtonJsonSerilizer";
  std::string property = "NewtonJsonSerilizer";
  std::string method = "ObjectToJson";
  std::string settingsVar = "settings";
  std::string writerVar = "tw";
  std::string param = "obj";
};

/// Fully-qualified names of the .NET types referenced by generated code.
namespace newtonsoft
{
inline constexpr std::string_view k_serializer_type = "Newtonsoft.Json.JsonSerializer";
inline constexpr std::string_view k_settings_type = "Newtonsoft.Json.JsonSerializerSettings";
inline constexpr std::string_view k_null_value_handling_type = "Newtonsoft.Json.NullValueHandling";
inline constexpr std::string_view k_null_value_handling = "NullValueHandling";
inline constexpr std::string_view k_ignore = "Ignore";
inline constexpr std::string_view k_create = "Create";
inline constexpr std::string_view k_serialize = "Serialize";
}  // namespace newtonsoft

namespace clr
{
inline constexpr std::string_view k_object = "System.Object";
inline constexpr std::string_view k_string = "System.String";
inline constexpr std::string_view k_text_writer = "System.IO.TextWriter";
inline constexpr std::string_view k_string_writer = "System.IO.StringWriter";
inline constexpr std::string_view k_to_string = "ToString";
}  // namespace clr

/**
 * Adds a lazily created Newtonsoft.Json serializer and an ObjectToJson
 * method to the service class.
 *
 * The builders are usable on their own; decorate_class() appends their
 * results (field, property, method) to the class in that order. There is no
 * duplicate check, so decorating the same class twice yields duplicate
 * member names.
 */
class ObjectToJsonDecorator final : public ServiceDecorator
{
public:
  /// Configuration name of this decorator.
  static constexpr std::string_view k_name = "object_to_json";

  ObjectToJsonDecorator() = default;
  explicit ObjectToJsonDecorator(SerializerNames names) : names_(std::move(names)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return k_name; }

  [[nodiscard]] const SerializerNames & names() const noexcept { return names_; }

  /// Appends field, property and method to `serviceClass`. `service` is unused.
  void decorate_class(
    const discovery::Service & service, ClassDecl & serviceClass, AstContext & ctx) override;

  /// private JsonSerializer newtonJsonSerilizer = null;
  [[nodiscard]] FieldDecl * create_serializer_field(CodeFactory & f) const;

  /**
   * The three statements that configure and create the serializer:
   * settings declaration, NullValueHandling = Ignore, and the
   * JsonSerializer.Create(settings) assignment to the field.
   */
  [[nodiscard]] gsl::span<Stmt *> create_serializer_creation_block(CodeFactory & f) const;

  /// Private get-only property that runs the creation block once and returns the field.
  [[nodiscard]] PropertyDecl * create_serializer_getter(CodeFactory & f) const;

  /// public string ObjectToJson(object obj)
  [[nodiscard]] MethodDecl * create_object_to_json(CodeFactory & f) const;

private:
  SerializerNames names_;
};

}  // namespace apigen
