#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fr/registry/Model.hpp>
#include <fr/registry/Comparable.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::registry {

template <typename Model>
class FieldTransformer : public Comparable {
public:
  using TypeDescription  = TypeDescriptionOf<Model>;
  using FieldDescription = FieldDescriptionOf<Model>;

  virtual FieldDescription transform(const TypeDescription & type, const FieldDescription & field) const = 0;
};

template <typename Model>
using FieldTransformerPtr = std::shared_ptr<const FieldTransformer<Model>>;

namespace transform {

template <typename Model>
class NoOp final : public ComparableBase<NoOp<Model>, FieldTransformer<Model>> {
public:
  FieldDescriptionOf<Model> transform(const TypeDescriptionOf<Model> &,
                                      const FieldDescriptionOf<Model> & field) const override {
    return field;
  }

  bool operator == (const NoOp &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
  std::string toString() const override { return "transform::NoOp"; }
};

// Applies each transformer to the output of the previous one.
template <typename Model>
class Compound final : public ComparableBase<Compound<Model>, FieldTransformer<Model>> {
public:
  explicit Compound(std::vector<FieldTransformerPtr<Model>> transformers)
    : _transformers(std::move(transformers))
  {
    for (const auto & transformer : _transformers) {
      if (!transformer) {
        throw std::invalid_argument("compound transformer contains a null transformer");
      }
    }
  }

  FieldDescriptionOf<Model> transform(const TypeDescriptionOf<Model> & type,
                                      const FieldDescriptionOf<Model> & field) const override {
    FieldDescriptionOf<Model> retval = field;
    for (const auto & transformer : _transformers) {
      retval = transformer->transform(type, retval);
    }
    return retval;
  }

  bool operator == (const Compound & other) const noexcept {
    if (_transformers.size() != other._transformers.size()) {
      return false;
    }
    for (size_t i = 0; i < _transformers.size(); ++i) {
      if (!_transformers[i]->equals(*other._transformers[i])) {
        return false;
      }
    }
    return true;
  }

  size_t hashValue() const noexcept {
    size_t retval = utility::FNV_OFFSET_BASIS;
    for (const auto & transformer : _transformers) {
      retval = utility::hashCombine(retval, transformer->hash());
    }
    return retval;
  }

  std::string toString() const override {
    return frmt::format("transform::Compound[{}]",
      utility::joinFormatted(_transformers, [] (const auto & transformer) { return transformer->toString(); }));
  }

private:
  std::vector<FieldTransformerPtr<Model>> _transformers;
};

template <typename Model>
class Function final : public ComparableBase<Function<Model>, FieldTransformer<Model>> {
public:
  using Transform = std::function<FieldDescriptionOf<Model>(const TypeDescriptionOf<Model> &,
                                                            const FieldDescriptionOf<Model> &)>;

  Function(std::string key, Transform transform)
    : _key(std::move(key)), _transform(std::move(transform))
  {
    if (!_transform) {
      throw std::invalid_argument(frmt::format("field transformer '{}' has no function", _key));
    }
  }

  FieldDescriptionOf<Model> transform(const TypeDescriptionOf<Model> & type,
                                      const FieldDescriptionOf<Model> & field) const override {
    return _transform(type, field);
  }

  bool operator == (const Function & other) const noexcept { return _key == other._key; }
  size_t hashValue() const noexcept { return utility::fnv1a(_key); }
  std::string toString() const override { return frmt::format("transform::Function({})", _key); }

private:
  std::string _key;
  Transform   _transform;
};

template <typename Model>
FieldTransformerPtr<Model> noOp() {
  return std::make_shared<const NoOp<Model>>();
}

template <typename Model>
FieldTransformerPtr<Model> compound(std::vector<FieldTransformerPtr<Model>> transformers) {
  return std::make_shared<const Compound<Model>>(std::move(transformers));
}

template <typename Model>
FieldTransformerPtr<Model> function(std::string key, typename Function<Model>::Transform transform) {
  return std::make_shared<const Function<Model>>(std::move(key), std::move(transform));
}

} // namespace transform

}
