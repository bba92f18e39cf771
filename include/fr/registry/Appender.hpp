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

// Produces the attribute appender for one type under construction. make() may be
// expensive; a compiled registry calls it at most once per equal factory.
template <typename Model>
class AppenderFactory : public Comparable {
public:
  using TypeDescription = TypeDescriptionOf<Model>;

  virtual AppenderPtr<Model> make(const TypeDescription & type) const = 0;
};

template <typename Model>
using AppenderFactoryPtr = std::shared_ptr<const AppenderFactory<Model>>;

namespace factory {

// Hands out one fixed appender; equal only to a factory holding the same instance.
template <typename Model>
class Explicit final : public ComparableBase<Explicit<Model>, AppenderFactory<Model>> {
public:
  explicit Explicit(AppenderPtr<Model> appender) : _appender(std::move(appender)) {
    if (!_appender) {
      throw std::invalid_argument("explicit appender factory requires an appender");
    }
  }

  AppenderPtr<Model> make(const TypeDescriptionOf<Model> &) const override {
    return _appender;
  }

  bool operator == (const Explicit & other) const noexcept { return _appender == other._appender; }
  size_t hashValue() const noexcept { return std::hash<const void *>{}(_appender.get()); }
  std::string toString() const override {
    return frmt::format("factory::Explicit({})", static_cast<const void *>(_appender.get()));
  }

private:
  AppenderPtr<Model> _appender;
};

template <typename Model>
class Function final : public ComparableBase<Function<Model>, AppenderFactory<Model>> {
public:
  using Maker = std::function<AppenderPtr<Model>(const TypeDescriptionOf<Model> &)>;

  Function(std::string key, Maker maker) : _key(std::move(key)), _maker(std::move(maker)) {
    if (!_maker) {
      throw std::invalid_argument(frmt::format("appender factory '{}' has no maker", _key));
    }
  }

  AppenderPtr<Model> make(const TypeDescriptionOf<Model> & type) const override {
    return _maker(type);
  }

  bool operator == (const Function & other) const noexcept { return _key == other._key; }
  size_t hashValue() const noexcept { return utility::fnv1a(_key); }
  std::string toString() const override { return frmt::format("factory::Function({})", _key); }

private:
  std::string _key;
  Maker       _maker;
};

template <typename Model>
AppenderFactoryPtr<Model> explicitly(AppenderPtr<Model> appender) {
  return std::make_shared<const Explicit<Model>>(std::move(appender));
}

template <typename Model>
AppenderFactoryPtr<Model> function(std::string key, typename Function<Model>::Maker maker) {
  return std::make_shared<const Function<Model>>(std::move(key), std::move(maker));
}

} // namespace factory

}
