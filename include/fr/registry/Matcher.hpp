#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <fr/registry/Model.hpp>
#include <fr/registry/Comparable.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::registry {

// Concrete predicate over the fields of one particular type.
template <typename Model>
class ElementMatcher : public Comparable {
public:
  using FieldDescription = FieldDescriptionOf<Model>;

  virtual bool matches(const FieldDescription & field) const = 0;
};

template <typename Model>
using ElementMatcherPtr = std::shared_ptr<const ElementMatcher<Model>>;

// Matcher that only becomes concrete once bound to the type under construction.
// resolve() must be deterministic for a given type.
template <typename Model>
class LatentMatcher : public Comparable {
public:
  using TypeDescription = TypeDescriptionOf<Model>;

  virtual ElementMatcherPtr<Model> resolve(const TypeDescription & type) const = 0;
};

template <typename Model>
using LatentMatcherPtr = std::shared_ptr<const LatentMatcher<Model>>;

namespace matcher {

template <typename Model>
class Any final : public ComparableBase<Any<Model>, ElementMatcher<Model>> {
public:
  bool matches(const FieldDescriptionOf<Model> &) const override { return true; }

  bool operator == (const Any &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
  std::string toString() const override { return "matcher::Any"; }
};

// Closure predicate; two instances are equal when their keys are equal.
template <typename Model>
class Function final : public ComparableBase<Function<Model>, ElementMatcher<Model>> {
public:
  using Predicate = std::function<bool(const FieldDescriptionOf<Model> &)>;

  Function(std::string key, Predicate predicate)
    : _key(std::move(key)), _predicate(std::move(predicate))
  {
    if (!_predicate) {
      throw std::invalid_argument(frmt::format("matcher '{}' has no predicate", _key));
    }
  }

  bool matches(const FieldDescriptionOf<Model> & field) const override {
    return _predicate(field);
  }

  bool operator == (const Function & other) const noexcept { return _key == other._key; }
  size_t hashValue() const noexcept { return utility::fnv1a(_key); }
  std::string toString() const override { return frmt::format("matcher::Function({})", _key); }

private:
  std::string _key;
  Predicate   _predicate;
};

template <typename Model>
ElementMatcherPtr<Model> any() {
  return std::make_shared<const Any<Model>>();
}

template <typename Model>
ElementMatcherPtr<Model> function(std::string key, typename Function<Model>::Predicate predicate) {
  return std::make_shared<const Function<Model>>(std::move(key), std::move(predicate));
}

} // namespace matcher

namespace latent {

// Already concrete; resolution ignores the type.
template <typename Model>
class Resolved final : public ComparableBase<Resolved<Model>, LatentMatcher<Model>> {
public:
  explicit Resolved(ElementMatcherPtr<Model> matcher) : _matcher(std::move(matcher)) {
    if (!_matcher) {
      throw std::invalid_argument("resolved latent matcher requires a matcher");
    }
  }

  ElementMatcherPtr<Model> resolve(const TypeDescriptionOf<Model> &) const override {
    return _matcher;
  }

  bool operator == (const Resolved & other) const noexcept { return _matcher->equals(*other._matcher); }
  size_t hashValue() const noexcept { return _matcher->hash(); }
  std::string toString() const override { return frmt::format("latent::Resolved({})", _matcher->toString()); }

private:
  ElementMatcherPtr<Model> _matcher;
};

template <typename Model>
class Function final : public ComparableBase<Function<Model>, LatentMatcher<Model>> {
public:
  using Resolver = std::function<ElementMatcherPtr<Model>(const TypeDescriptionOf<Model> &)>;

  Function(std::string key, Resolver resolver)
    : _key(std::move(key)), _resolver(std::move(resolver))
  {
    if (!_resolver) {
      throw std::invalid_argument(frmt::format("latent matcher '{}' has no resolver", _key));
    }
  }

  ElementMatcherPtr<Model> resolve(const TypeDescriptionOf<Model> & type) const override {
    return _resolver(type);
  }

  bool operator == (const Function & other) const noexcept { return _key == other._key; }
  size_t hashValue() const noexcept { return utility::fnv1a(_key); }
  std::string toString() const override { return frmt::format("latent::Function({})", _key); }

private:
  std::string _key;
  Resolver    _resolver;
};

template <typename Model>
LatentMatcherPtr<Model> resolved(ElementMatcherPtr<Model> matcher) {
  return std::make_shared<const Resolved<Model>>(std::move(matcher));
}

template <typename Model>
LatentMatcherPtr<Model> function(std::string key, typename Function<Model>::Resolver resolver) {
  return std::make_shared<const Function<Model>>(std::move(key), std::move(resolver));
}

} // namespace latent

}
