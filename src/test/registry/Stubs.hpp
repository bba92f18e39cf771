#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <fr/model/Descriptor.hpp>
#include <fr/model/Attributes.hpp>
#include <fr/model/Rules.hpp>
#include <fr/registry/Matcher.hpp>
#include <fr/registry/Appender.hpp>
#include <fr/registry/Transformer.hpp>

namespace fr::test {

using namespace fr::model;
using fr::registry::ComparableBase;

struct Calls {
  std::atomic<int> resolve{0};
  std::atomic<int> matches{0};
  std::atomic<int> make{0};
  std::atomic<int> transform{0};

  void reset() {
    resolve = 0;
    matches = 0;
    make = 0;
    transform = 0;
  }
};

using CallsPtr = std::shared_ptr<Calls>;

// Matches the listed field names and counts every evaluation.
class CountingElementMatcher final : public ComparableBase<CountingElementMatcher, registry::ElementMatcher<Descriptors>> {
public:
  CountingElementMatcher(std::set<std::string> names, CallsPtr calls) : _names(std::move(names)), _calls(std::move(calls)) {}

  bool matches(const FieldDescription & field) const override {
    ++_calls->matches;
    return _names.empty() || _names.count(field.name) > 0;
  }

  bool operator == (const CountingElementMatcher & other) const noexcept { return _names == other._names; }
  size_t hashValue() const noexcept { return _names.size(); }

private:
  std::set<std::string> _names;
  CallsPtr              _calls;
};

// An empty name set matches every field.
class CountingMatcher final : public ComparableBase<CountingMatcher, registry::LatentMatcher<Descriptors>> {
public:
  CountingMatcher(std::set<std::string> names, CallsPtr calls) : _names(std::move(names)), _calls(std::move(calls)) {}

  registry::ElementMatcherPtr<Descriptors> resolve(const TypeDescription &) const override {
    ++_calls->resolve;
    return std::make_shared<const CountingElementMatcher>(_names, _calls);
  }

  bool operator == (const CountingMatcher & other) const noexcept { return _names == other._names; }
  size_t hashValue() const noexcept { return _names.size(); }

private:
  std::set<std::string> _names;
  CallsPtr              _calls;
};

// Equal when keys are equal; every make() yields a fresh appender which is remembered.
class CountingFactory final : public ComparableBase<CountingFactory, registry::AppenderFactory<Descriptors>> {
public:
  CountingFactory(std::string key, CallsPtr calls) : _key(std::move(key)), _calls(std::move(calls)) {}

  registry::AppenderPtr<Descriptors> make(const TypeDescription & type) const override {
    ++_calls->make;
    auto appender = std::make_shared<const AnnotationAppender>(std::vector<std::string>{"@" + _key, "@" + type.name});
    std::lock_guard<std::mutex> guard(*_lock);
    _made->push_back(appender);
    return appender;
  }

  std::vector<registry::AppenderPtr<Descriptors>> made() const {
    std::lock_guard<std::mutex> guard(*_lock);
    return *_made;
  }

  bool operator == (const CountingFactory & other) const noexcept { return _key == other._key; }
  size_t hashValue() const noexcept { return utility::fnv1a(_key); }

private:
  std::string _key;
  CallsPtr    _calls;
  std::shared_ptr<std::mutex> _lock = std::make_shared<std::mutex>();
  std::shared_ptr<std::vector<registry::AppenderPtr<Descriptors>>> _made =
    std::make_shared<std::vector<registry::AppenderPtr<Descriptors>>>();
};

class ThrowingFactory final : public ComparableBase<ThrowingFactory, registry::AppenderFactory<Descriptors>> {
public:
  registry::AppenderPtr<Descriptors> make(const TypeDescription & type) const override {
    throw std::runtime_error("cannot make appender for " + type.name);
  }

  bool operator == (const ThrowingFactory &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
};

// Appends a suffix to the field name and records every field it was given.
class CountingTransformer final : public ComparableBase<CountingTransformer, registry::FieldTransformer<Descriptors>> {
public:
  CountingTransformer(std::string suffix, CallsPtr calls) : _suffix(std::move(suffix)), _calls(std::move(calls)) {}

  FieldDescription transform(const TypeDescription &, const FieldDescription & field) const override {
    ++_calls->transform;
    {
      std::lock_guard<std::mutex> guard(*_lock);
      _seen->push_back(field.name);
    }
    FieldDescription retval = field;
    retval.name += _suffix;
    return retval;
  }

  std::vector<std::string> seen() const {
    std::lock_guard<std::mutex> guard(*_lock);
    return *_seen;
  }

  bool operator == (const CountingTransformer & other) const noexcept { return _suffix == other._suffix; }
  size_t hashValue() const noexcept { return utility::fnv1a(_suffix); }

private:
  std::string _suffix;
  CallsPtr    _calls;
  std::shared_ptr<std::mutex> _lock = std::make_shared<std::mutex>();
  std::shared_ptr<std::vector<std::string>> _seen = std::make_shared<std::vector<std::string>>();
};

inline TypeDescription sampleType(const std::string & name = "Sample") {
  TypeDescription type{name, {}};
  type.declare("x", "int").declare("y", "int").declare("z", "double", PUBLIC | STATIC | FINAL);
  return type;
}

inline const FieldDescription & fieldOf(const TypeDescription & type, const std::string & name) {
  for (const auto & field : type.fields) {
    if (field.name == name) {
      return field;
    }
  }
  throw std::out_of_range("no field " + name);
}

inline std::vector<std::string> annotationsOf(const FieldRecord & record, const TypeDescription & type) {
  AttributeSink sink;
  if (!record.isImplicit()) {
    record.appender()->apply(sink, type, record.field());
  }
  return sink.annotations;
}

}
