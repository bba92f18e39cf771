#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fr/model/Descriptor.hpp>
#include <fr/model/Attributes.hpp>
#include <fr/registry/Matcher.hpp>
#include <fr/registry/Transformer.hpp>
#include <fr/registry/FieldRegistry.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::model {

using FieldRegistry   = registry::FieldRegistry<Descriptors>;
using CompiledFields  = registry::CompiledFieldRegistry<Descriptors>;
using FieldRecord     = registry::FieldRecord<Descriptors>;
using FieldPool       = registry::FieldPool<Descriptors>;
using NoOpFieldPool   = registry::NoOpFieldPool<Descriptors>;

namespace matchers {

class Named final : public registry::ComparableBase<Named, registry::ElementMatcher<Descriptors>> {
public:
  explicit Named(std::string name) : _name(std::move(name)) {}

  bool matches(const FieldDescription & field) const override { return field.name == _name; }

  bool operator == (const Named & other) const noexcept { return _name == other._name; }
  size_t hashValue() const noexcept { return utility::fnv1a(_name); }
  std::string toString() const override { return frmt::format("named({})", _name); }

private:
  std::string _name;
};

class OfType final : public registry::ComparableBase<OfType, registry::ElementMatcher<Descriptors>> {
public:
  explicit OfType(std::string type) : _type(std::move(type)) {}

  bool matches(const FieldDescription & field) const override { return field.type == _type; }

  bool operator == (const OfType & other) const noexcept { return _type == other._type; }
  size_t hashValue() const noexcept { return utility::fnv1a(_type); }
  std::string toString() const override { return frmt::format("ofType({})", _type); }

private:
  std::string _type;
};

// All bits of the mask must be present.
class WithModifiers final : public registry::ComparableBase<WithModifiers, registry::ElementMatcher<Descriptors>> {
public:
  explicit WithModifiers(uint32_t mask) : _mask(mask) {}

  bool matches(const FieldDescription & field) const override { return (field.modifiers & _mask) == _mask; }

  bool operator == (const WithModifiers & other) const noexcept { return _mask == other._mask; }
  size_t hashValue() const noexcept { return _mask; }
  std::string toString() const override { return frmt::format("withModifiers({})", modifiersToString(_mask)); }

private:
  uint32_t _mask;
};

class DeclaredIn final : public registry::ComparableBase<DeclaredIn, registry::ElementMatcher<Descriptors>> {
public:
  explicit DeclaredIn(std::string type) : _type(std::move(type)) {}

  bool matches(const FieldDescription & field) const override { return field.declaringType == _type; }

  bool operator == (const DeclaredIn & other) const noexcept { return _type == other._type; }
  size_t hashValue() const noexcept { return utility::fnv1a(_type); }
  std::string toString() const override { return frmt::format("declaredIn({})", _type); }

private:
  std::string _type;
};

// Latent: matches the fields the type under construction declares itself.
class DeclaredBy final : public registry::ComparableBase<DeclaredBy, registry::LatentMatcher<Descriptors>> {
public:
  registry::ElementMatcherPtr<Descriptors> resolve(const TypeDescription & type) const override {
    return std::make_shared<const DeclaredIn>(type.name);
  }

  bool operator == (const DeclaredBy &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
  std::string toString() const override { return "declaredBy"; }
};

inline registry::ElementMatcherPtr<Descriptors> named(std::string name) {
  return std::make_shared<const Named>(std::move(name));
}

inline registry::ElementMatcherPtr<Descriptors> ofType(std::string type) {
  return std::make_shared<const OfType>(std::move(type));
}

inline registry::ElementMatcherPtr<Descriptors> withModifiers(uint32_t mask) {
  return std::make_shared<const WithModifiers>(mask);
}

inline registry::LatentMatcherPtr<Descriptors> declaredBy() {
  return std::make_shared<const DeclaredBy>();
}

// Latent form of a concrete matcher.
inline registry::LatentMatcherPtr<Descriptors> field(registry::ElementMatcherPtr<Descriptors> matcher) {
  return registry::latent::resolved<Descriptors>(std::move(matcher));
}

inline registry::LatentMatcherPtr<Descriptors> field(std::string name) {
  return field(named(std::move(name)));
}

} // namespace matchers

namespace transformers {

class Modifiers final : public registry::ComparableBase<Modifiers, registry::FieldTransformer<Descriptors>> {
public:
  Modifiers(uint32_t set, uint32_t clear) : _set(set), _clear(clear) {}

  FieldDescription transform(const TypeDescription &, const FieldDescription & field) const override {
    FieldDescription retval = field;
    retval.modifiers = (field.modifiers | _set) & ~_clear;
    return retval;
  }

  bool operator == (const Modifiers & other) const noexcept { return _set == other._set && _clear == other._clear; }
  size_t hashValue() const noexcept { return utility::hashCombine(_set, _clear); }
  std::string toString() const override {
    return frmt::format("modifiers(+[{}] -[{}])", modifiersToString(_set), modifiersToString(_clear));
  }

private:
  uint32_t _set;
  uint32_t _clear;
};

class Prefixed final : public registry::ComparableBase<Prefixed, registry::FieldTransformer<Descriptors>> {
public:
  explicit Prefixed(std::string prefix) : _prefix(std::move(prefix)) {}

  FieldDescription transform(const TypeDescription &, const FieldDescription & field) const override {
    FieldDescription retval = field;
    retval.name = _prefix + field.name;
    return retval;
  }

  bool operator == (const Prefixed & other) const noexcept { return _prefix == other._prefix; }
  size_t hashValue() const noexcept { return utility::fnv1a(_prefix); }
  std::string toString() const override { return frmt::format("prefixed({})", _prefix); }

private:
  std::string _prefix;
};

inline registry::FieldTransformerPtr<Descriptors> none() {
  return registry::transform::noOp<Descriptors>();
}

inline registry::FieldTransformerPtr<Descriptors> modifiers(uint32_t set, uint32_t clear = 0) {
  return std::make_shared<const Modifiers>(set, clear);
}

inline registry::FieldTransformerPtr<Descriptors> prefixed(std::string prefix) {
  return std::make_shared<const Prefixed>(std::move(prefix));
}

} // namespace transformers

}
