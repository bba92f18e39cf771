#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <fr/registry/Model.hpp>
#include <fr/utility/Format.hpp>

namespace fr::registry {

// Outcome of dispatching one field: configured by a rule (Explicit) or passed through (Implicit).
template <DescriptorModel Model>
class FieldRecord {
public:
  using FieldDescription = FieldDescriptionOf<Model>;
  using Value            = typename Model::Value;

  struct Explicit {
    AppenderPtr<Model>    appender;
    std::optional<Value>  defaultValue;
    FieldDescription      field;
  };

  struct Implicit {
    FieldDescription field;
  };

  static FieldRecord forExplicit(AppenderPtr<Model> appender, std::optional<Value> defaultValue, FieldDescription field) {
    return FieldRecord(Explicit{std::move(appender), std::move(defaultValue), std::move(field)});
  }

  static FieldRecord forImplicit(FieldDescription field) {
    return FieldRecord(Implicit{std::move(field)});
  }

  bool isImplicit() const noexcept {
    return std::holds_alternative<Implicit>(_binding);
  }

  // The transformed field for an explicit record, the original one otherwise.
  const FieldDescription & field() const noexcept {
    return std::visit([] (const auto & binding) -> const FieldDescription & { return binding.field; }, _binding);
  }

  const AppenderPtr<Model> & appender() const {
    if (const auto * binding = std::get_if<Explicit>(&_binding); binding) {
      return binding->appender;
    }
    throw std::logic_error(frmt::format("An implicit field record has no attribute appender: {}",
      Model::describe(field())));
  }

  const std::optional<Value> & defaultValue() const noexcept {
    static const std::optional<Value> none;
    if (const auto * binding = std::get_if<Explicit>(&_binding); binding) {
      return binding->defaultValue;
    }
    return none;
  }

  // The rule's initializer when it has one, otherwise the fallback.
  std::optional<Value> resolveDefault(std::optional<Value> fallback) const {
    const auto & value = defaultValue();
    return value ? value : std::move(fallback);
  }

  template <typename Visitor>
  decltype(auto) visit(Visitor && visitor) const {
    return std::visit(std::forward<Visitor>(visitor), _binding);
  }

  bool operator == (const FieldRecord & other) const {
    if (_binding.index() != other._binding.index()) {
      return false;
    }
    if (isImplicit()) {
      return fieldsEqual(field(), other.field());
    }
    const auto & lhs = std::get<Explicit>(_binding);
    const auto & rhs = std::get<Explicit>(other._binding);
    return lhs.appender == rhs.appender && lhs.defaultValue == rhs.defaultValue && fieldsEqual(lhs.field, rhs.field);
  }

  std::string toString() const {
    if (isImplicit()) {
      return frmt::format("FieldRecord.Implicit{{field={}}}", Model::describe(field()));
    }
    const auto & binding = std::get<Explicit>(_binding);
    return frmt::format("FieldRecord.Explicit{{field={}, defaultValue={}, appender={}}}",
      Model::describe(binding.field),
      binding.defaultValue ? Model::describe(*binding.defaultValue) : std::string("none"),
      static_cast<const void *>(binding.appender.get()));
  }

private:
  explicit FieldRecord(std::variant<Explicit, Implicit> binding) : _binding(std::move(binding)) {}

  static bool fieldsEqual(const FieldDescription & lhs, const FieldDescription & rhs) {
    if constexpr (std::equality_comparable<FieldDescription>) {
      return lhs == rhs;
    }
    else {
      return Model::describe(lhs) == Model::describe(rhs);
    }
  }

  std::variant<Explicit, Implicit> _binding;
};

template <DescriptorModel Model>
std::ostream & operator << (std::ostream & os, const FieldRecord<Model> & record) {
  return os << record.toString();
}

}
