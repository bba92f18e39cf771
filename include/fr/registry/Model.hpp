#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>

namespace fr::registry {

// Traits describing the external descriptor model a registry is instantiated for.
//   TypeDescription  - the type under construction
//   FieldDescription - one field of that type
//   Value            - constant initializer of a field
//   Appender         - attribute metadata producer
template <typename Model>
concept DescriptorModel = requires(const typename Model::TypeDescription & type,
                                   const typename Model::FieldDescription & field,
                                   const typename Model::Value & value) {
  typename Model::Appender;
  { Model::describe(type) } -> std::convertible_to<std::string>;
  { Model::describe(field) } -> std::convertible_to<std::string>;
  { Model::describe(value) } -> std::convertible_to<std::string>;
  { Model::hashValue(value) } -> std::convertible_to<size_t>;
} && std::equality_comparable<typename Model::TypeDescription>
  && std::equality_comparable<typename Model::Value>
  && std::copy_constructible<typename Model::TypeDescription>
  && std::copy_constructible<typename Model::FieldDescription>;

template <typename Model>
using TypeDescriptionOf = typename Model::TypeDescription;

template <typename Model>
using FieldDescriptionOf = typename Model::FieldDescription;

template <typename Model>
using AppenderPtr = std::shared_ptr<const typename Model::Appender>;

}
