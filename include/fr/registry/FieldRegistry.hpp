#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fr/registry/Model.hpp>
#include <fr/registry/Comparable.hpp>
#include <fr/registry/Matcher.hpp>
#include <fr/registry/Appender.hpp>
#include <fr/registry/Transformer.hpp>
#include <fr/registry/FieldRecord.hpp>
#include <fr/registry/CompiledFieldRegistry.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::registry {

// One registration: which fields (latent matcher) get which attribute appender,
// initializer and field transformation.
template <DescriptorModel Model>
class FieldRule {
public:
  using Value = typename Model::Value;

  FieldRule(LatentMatcherPtr<Model> matcher,
            AppenderFactoryPtr<Model> appenderFactory,
            std::optional<Value> defaultValue,
            FieldTransformerPtr<Model> transformer)
    : _matcher(std::move(matcher)),
      _appenderFactory(std::move(appenderFactory)),
      _defaultValue(std::move(defaultValue)),
      _transformer(std::move(transformer))
  {
    if (!_matcher || !_appenderFactory || !_transformer) {
      throw std::invalid_argument(frmt::format("Field rule requires a matcher, an appender factory and a transformer; got {}",
        toString()));
    }
  }

  ElementMatcherPtr<Model> resolve(const TypeDescriptionOf<Model> & type) const {
    return _matcher->resolve(type);
  }

  const LatentMatcherPtr<Model> &     matcher() const noexcept { return _matcher; }
  const AppenderFactoryPtr<Model> &   appenderFactory() const noexcept { return _appenderFactory; }
  const std::optional<Value> &        defaultValue() const noexcept { return _defaultValue; }
  const FieldTransformerPtr<Model> &  transformer() const noexcept { return _transformer; }

  bool operator == (const FieldRule & other) const {
    return equalHandles(_matcher, other._matcher)
        && equalHandles(_appenderFactory, other._appenderFactory)
        && _defaultValue == other._defaultValue
        && equalHandles(_transformer, other._transformer);
  }

  size_t hash() const noexcept {
    size_t retval = hashHandle(_matcher);
    retval = utility::hashCombine(retval, hashHandle(_appenderFactory));
    retval = utility::hashCombine(retval, _defaultValue ? Model::hashValue(*_defaultValue) : 0);
    return utility::hashCombine(retval, hashHandle(_transformer));
  }

  std::string toString() const {
    return frmt::format("FieldRule{{matcher={}, appenderFactory={}, defaultValue={}, transformer={}}}",
      describeHandle(_matcher), describeHandle(_appenderFactory),
      _defaultValue ? Model::describe(*_defaultValue) : std::string("none"),
      describeHandle(_transformer));
  }

private:
  LatentMatcherPtr<Model>     _matcher;
  AppenderFactoryPtr<Model>   _appenderFactory;
  std::optional<Value>        _defaultValue;
  FieldTransformerPtr<Model>  _transformer;
};

// Ordered, immutable rule list. prepend() returns a new registry whose new rule has the
// highest priority; the tail is shared with the receiver.
template <DescriptorModel Model>
class FieldRegistry {
  // next is only moved out while tearing down the last owner of the chain.
  struct Node {
    FieldRule<Model>                     rule;
    mutable std::shared_ptr<const Node>  next;
  };

public:
  using Rule            = FieldRule<Model>;
  using Compiled        = CompiledFieldRegistry<Model>;
  using TypeDescription = TypeDescriptionOf<Model>;
  using Value           = typename Model::Value;

  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = Rule;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Rule *;
    using reference         = const Rule &;

    const_iterator() = default;
    explicit const_iterator(const Node * node) : _node(node) {}

    reference operator * () const { return _node->rule; }
    pointer operator -> () const { return &_node->rule; }

    const_iterator & operator ++ () {
      _node = _node->next.get();
      return *this;
    }

    const_iterator operator ++ (int) {
      const_iterator retval = *this;
      ++(*this);
      return retval;
    }

    bool operator == (const const_iterator & other) const noexcept { return _node == other._node; }

  private:
    const Node * _node = nullptr;
  };

  FieldRegistry() = default;

  FieldRegistry(const FieldRegistry &) = default;

  FieldRegistry(FieldRegistry && other) noexcept
    : _head(std::move(other._head)), _size(std::exchange(other._size, 0))
  {
  }

  // The released chain is torn down by the destructor of other.
  FieldRegistry & operator = (FieldRegistry other) noexcept {
    std::swap(_head, other._head);
    std::swap(_size, other._size);
    return *this;
  }

  // Unlinks iteratively; recursive shared_ptr release would use one stack frame per rule.
  ~FieldRegistry() {
    std::shared_ptr<const Node> node = std::move(_head);
    while (node && node.use_count() == 1) {
      std::shared_ptr<const Node> next = std::move(node->next);
      node = std::move(next);
    }
  }

  [[nodiscard]]
  FieldRegistry prepend(LatentMatcherPtr<Model> matcher,
                        AppenderFactoryPtr<Model> appenderFactory,
                        std::optional<Value> defaultValue,
                        FieldTransformerPtr<Model> transformer) const {
    return prepend(Rule(std::move(matcher), std::move(appenderFactory), std::move(defaultValue), std::move(transformer)));
  }

  [[nodiscard]]
  FieldRegistry prepend(Rule rule) const {
    auto head = std::make_shared<const Node>(Node{std::move(rule), _head});
    return FieldRegistry(std::move(head), _size + 1);
  }

  // Binds every rule to the given type. Each distinct (by value) appender factory is
  // invoked exactly once; the cache does not outlive this call.
  Compiled compile(const TypeDescription & instrumentedType) const {
    std::unordered_map<AppenderFactoryPtr<Model>, AppenderPtr<Model>, FactoryHash, FactoryEqual> appenders;
    std::vector<typename Compiled::Entry> entries;
    entries.reserve(_size);

    for (const Rule & rule : *this) {
      auto matcher = rule.resolve(instrumentedType);
      if (!matcher) {
        throw std::invalid_argument(frmt::format("Latent matcher {} resolved to no matcher for {}",
          describeHandle(rule.matcher()), Model::describe(instrumentedType)));
      }
      auto it = appenders.find(rule.appenderFactory());
      if (it == appenders.end()) {
        it = appenders.emplace(rule.appenderFactory(), rule.appenderFactory()->make(instrumentedType)).first;
      }
      entries.push_back(typename Compiled::Entry{std::move(matcher), it->second, rule.defaultValue(), rule.transformer()});
    }
    return Compiled(instrumentedType, std::move(entries));
  }

  const_iterator begin() const noexcept { return const_iterator(_head.get()); }
  const_iterator end() const noexcept { return const_iterator(); }

  template <typename Callable>
  void forEach(Callable && callable) const {
    for (const Rule & rule : *this) {
      callable(rule);
    }
  }

  size_t size() const noexcept { return _size; }
  bool empty() const noexcept { return _size == 0; }

  bool operator == (const FieldRegistry & other) const {
    if (_size != other._size) {
      return false;
    }
    for (auto lhs = begin(), rhs = other.begin(); lhs != end(); ++lhs, ++rhs) {
      // shared tail
      if (lhs == rhs) {
        return true;
      }
      if (!(*lhs == *rhs)) {
        return false;
      }
    }
    return true;
  }

  size_t hash() const noexcept {
    size_t retval = utility::FNV_OFFSET_BASIS;
    for (const Rule & rule : *this) {
      retval = utility::hashCombine(retval, rule.hash());
    }
    return retval;
  }

  std::string toString() const {
    return frmt::format("FieldRegistry{{entries=[{}]}}",
      utility::joinFormatted(*this, [] (const Rule & rule) { return rule.toString(); }));
  }

private:
  struct FactoryHash {
    size_t operator () (const AppenderFactoryPtr<Model> & factory) const noexcept {
      return factory->hash();
    }
  };

  struct FactoryEqual {
    bool operator () (const AppenderFactoryPtr<Model> & lhs, const AppenderFactoryPtr<Model> & rhs) const noexcept {
      return equalHandles(lhs, rhs);
    }
  };

  FieldRegistry(std::shared_ptr<const Node> head, size_t size) : _head(std::move(head)), _size(size) {}

  std::shared_ptr<const Node>  _head;
  size_t                       _size = 0;
};

template <DescriptorModel Model>
std::ostream & operator << (std::ostream & os, const FieldRule<Model> & rule) {
  return os << rule.toString();
}

template <DescriptorModel Model>
std::ostream & operator << (std::ostream & os, const FieldRegistry<Model> & registry) {
  return os << registry.toString();
}

}

namespace std {

template <fr::registry::DescriptorModel Model>
struct hash<fr::registry::FieldRegistry<Model>> {
  size_t operator () (const fr::registry::FieldRegistry<Model> & registry) const noexcept {
    return registry.hash();
  }
};

}
