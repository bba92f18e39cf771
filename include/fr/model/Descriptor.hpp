#pragma once

#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fr/type/TypeList.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Text.hpp>

namespace fr::model {

enum Modifier : uint32_t {
  PUBLIC    = 0x0001,
  PRIVATE   = 0x0002,
  PROTECTED = 0x0004,
  STATIC    = 0x0008,
  FINAL     = 0x0010,
  VOLATILE  = 0x0040,
  TRANSIENT = 0x0080,
};

inline constexpr std::pair<Modifier, const char *> MODIFIER_NAMES[] = {
  {PUBLIC, "public"}, {PRIVATE, "private"}, {PROTECTED, "protected"}, {STATIC, "static"},
  {FINAL, "final"}, {VOLATILE, "volatile"}, {TRANSIENT, "transient"},
};

// "public, static final" -> PUBLIC | STATIC | FINAL
inline uint32_t parseModifiers(const std::string & text) {
  uint32_t retval = 0;
  for (const auto & list : utility::splitString(text, ',')) {
    for (const auto & token : utility::splitString(list, ' ')) {
      const std::string name = utility::toLower(token);
      bool known = false;
      for (const auto & [modifier, spelling] : MODIFIER_NAMES) {
        if (name == spelling) {
          retval |= modifier;
          known = true;
          break;
        }
      }
      if (!known) {
        throw std::invalid_argument(frmt::format("Unknown field modifier '{}'", token));
      }
    }
  }
  return retval;
}

inline std::string modifiersToString(uint32_t modifiers) {
  std::string retval;
  for (const auto & [modifier, spelling] : MODIFIER_NAMES) {
    if (modifiers & modifier) {
      if (!retval.empty()) {
        retval += ' ';
      }
      retval += spelling;
    }
  }
  return retval;
}

struct FieldDescription {
  std::string name;
  std::string type;
  uint32_t    modifiers = 0;
  std::string declaringType;

  bool operator == (const FieldDescription &) const = default;

  bool isStatic() const noexcept { return modifiers & STATIC; }
  bool isFinal() const noexcept { return modifiers & FINAL; }
};

struct TypeDescription {
  std::string                   name;
  std::vector<FieldDescription> fields;

  bool operator == (const TypeDescription &) const = default;

  TypeDescription & declare(std::string fieldName, std::string fieldType, uint32_t modifiers = PRIVATE) {
    fields.push_back(FieldDescription{std::move(fieldName), std::move(fieldType), modifiers, name});
    return *this;
  }
};

using ValueTypes = type::type_list<bool, int64_t, double, std::string>;
using Value      = ValueTypes::variant_type;

// Indexed like ValueTypes.
inline constexpr const char * VALUE_TYPE_NAMES[] = {"bool", "int64", "double", "string"};

static_assert(std::size(VALUE_TYPE_NAMES) == boost::mp11::mp_size<ValueTypes>::value);

// What an appender contributes to one emitted field.
struct AttributeSink {
  std::vector<std::string> annotations;
};

class FieldAttributeAppender {
public:
  virtual ~FieldAttributeAppender() = default;

  virtual void apply(AttributeSink & sink, const TypeDescription & type, const FieldDescription & field) const = 0;
};

// Traits binding the registry templates to this model.
struct Descriptors {
  using TypeDescription  = model::TypeDescription;
  using FieldDescription = model::FieldDescription;
  using Value            = model::Value;
  using Appender         = FieldAttributeAppender;

  static std::string describe(const TypeDescription & type) {
    return frmt::format("{}[{} fields]", type.name, type.fields.size());
  }

  static std::string describe(const FieldDescription & field) {
    const std::string modifiers = modifiersToString(field.modifiers);
    return frmt::format("{}{}{} {}.{}", modifiers, modifiers.empty() ? "" : " ", field.type, field.declaringType, field.name);
  }

  static std::string describe(const Value & value) {
    return std::visit([&value] (const auto & held) {
      return frmt::format("{}({})", VALUE_TYPE_NAMES[value.index()], held);
    }, value);
  }

  static size_t hashValue(const Value & value) {
    return std::hash<Value>{}(value);
  }
};

}
