#pragma once

#include <exception>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <fr/config/Context.hpp>
#include <fr/model/Descriptor.hpp>
#include <fr/model/Attributes.hpp>
#include <fr/model/Rules.hpp>
#include <fr/utility/Format.hpp>

namespace fr::skeleton {

using namespace fr::model;

inline constexpr const char * APP_NAME = "fieldreg-demo";

// {"types": [{"name": "Order", "fields": [{"name": "id", "type": "long", "modifiers": "private final"}]}]}
inline std::vector<TypeDescription> loadTypes(const config::Context & context) {
  std::vector<TypeDescription> types;
  if (!context.config.hasChild("types")) {
    TypeDescription order{"Order", {}};
    order.declare("id", "long", PRIVATE | FINAL)
         .declare("price", "double")
         .declare("VERSION", "int", PUBLIC | STATIC | FINAL)
         .declare("cache", "java.util.Map", PRIVATE | TRANSIENT);
    order.fields.push_back(FieldDescription{"owner", "java.lang.String", PROTECTED, "Entity"});
    types.push_back(std::move(order));
    return types;
  }

  for (const auto & [unused, node] : context.getChild("types")) {
    TypeDescription type{node.get<std::string>("name"), {}};
    if (auto fields = node.get_child_optional("fields"); fields) {
      for (const auto & [ignored, field] : *fields) {
        type.fields.push_back(FieldDescription{
          field.get<std::string>("name"),
          field.get<std::string>("type"),
          parseModifiers(field.get<std::string>("modifiers", "")),
          field.get<std::string>("declaringType", type.name)});
      }
    }
    types.push_back(std::move(type));
  }
  return types;
}

inline FieldRegistry makeRegistry() {
  using namespace matchers;
  return FieldRegistry{}
    .prepend(declaredBy(), attributes::owner(), std::nullopt, transformers::none())
    .prepend(field(withModifiers(TRANSIENT)), attributes::annotated({"@Transient"}), std::nullopt,
             transformers::modifiers(0, FINAL))
    .prepend(field(withModifiers(STATIC | FINAL)), attributes::annotated({"@Constant"}), Value{int64_t{1}},
             transformers::none())
    .prepend(field("price"), attributes::annotated({"@Money", "@NotNull"}), Value{0.0},
             transformers::prefixed("m_"));
}

// Prints the binding of every field of every configured type; returns the process exit code.
inline int runDemo(const char * cfgfile, std::ostream & out) {
  try {
    config::Context context(APP_NAME, cfgfile);
    const bool verbose = context.getConfig<bool>("output", "verbose", "false");
    const FieldRegistry registry = makeRegistry();
    if (verbose) {
      context.report(registry.toString());
    }

    for (const auto & type : loadTypes(context)) {
      const CompiledFields compiled = registry.compile(type);
      if (verbose) {
        context.report(compiled.toString());
      }
      out << type.name << std::endl;
      for (const auto & field : type.fields) {
        const FieldRecord record = compiled.resolve(field);
        AttributeSink sink;
        if (!record.isImplicit()) {
          record.appender()->apply(sink, type, record.field());
        }
        out << frmt::format("  {:<40} {:<8} init={:<12} [{}]",
          Descriptors::describe(record.field()),
          record.isImplicit() ? "implicit" : "explicit",
          record.defaultValue() ? Descriptors::describe(*record.defaultValue()) : std::string("-"),
          utility::joinFormatted(sink.annotations, [] (const std::string & annotation) { return annotation; }, " "))
          << std::endl;
      }
    }
  }
  catch (const std::exception & ex) {
    config::reportFatal(APP_NAME, ex.what());
    return 1;
  }
  return 0;
}

}
