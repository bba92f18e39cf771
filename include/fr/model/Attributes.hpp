#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fr/model/Descriptor.hpp>
#include <fr/registry/Appender.hpp>
#include <fr/utility/Format.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::model {

class NoOpAppender final : public FieldAttributeAppender {
public:
  void apply(AttributeSink &, const TypeDescription &, const FieldDescription &) const override {}
};

class AnnotationAppender final : public FieldAttributeAppender {
public:
  explicit AnnotationAppender(std::vector<std::string> annotations) : _annotations(std::move(annotations)) {}

  void apply(AttributeSink & sink, const TypeDescription &, const FieldDescription &) const override {
    sink.annotations.insert(sink.annotations.end(), _annotations.begin(), _annotations.end());
  }

  const std::vector<std::string> & annotations() const noexcept { return _annotations; }

private:
  std::vector<std::string> _annotations;
};

// Records the owning type on every field it is applied to.
class OwnerAppender final : public FieldAttributeAppender {
public:
  explicit OwnerAppender(std::string owner) : _owner(std::move(owner)) {}

  void apply(AttributeSink & sink, const TypeDescription &, const FieldDescription & field) const override {
    sink.annotations.push_back(frmt::format("@Owner({}.{})", _owner, field.name));
  }

private:
  std::string _owner;
};

namespace attributes {

class NoOp final : public registry::ComparableBase<NoOp, registry::AppenderFactory<Descriptors>> {
public:
  registry::AppenderPtr<Descriptors> make(const TypeDescription &) const override {
    static const auto appender = std::make_shared<const NoOpAppender>();
    return appender;
  }

  bool operator == (const NoOp &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
  std::string toString() const override { return "attributes::NoOp"; }
};

// A fresh appender per compile; equal when the annotation lists are equal.
class Annotations final : public registry::ComparableBase<Annotations, registry::AppenderFactory<Descriptors>> {
public:
  explicit Annotations(std::vector<std::string> annotations) : _annotations(std::move(annotations)) {}

  registry::AppenderPtr<Descriptors> make(const TypeDescription &) const override {
    return std::make_shared<const AnnotationAppender>(_annotations);
  }

  bool operator == (const Annotations & other) const noexcept { return _annotations == other._annotations; }

  size_t hashValue() const noexcept {
    size_t retval = utility::FNV_OFFSET_BASIS;
    for (const auto & annotation : _annotations) {
      retval = utility::hashCombine(retval, utility::fnv1a(annotation));
    }
    return retval;
  }

  std::string toString() const override {
    return frmt::format("attributes::Annotations[{}]",
      utility::joinFormatted(_annotations, [] (const std::string & annotation) { return annotation; }));
  }

private:
  std::vector<std::string> _annotations;
};

class Owner final : public registry::ComparableBase<Owner, registry::AppenderFactory<Descriptors>> {
public:
  registry::AppenderPtr<Descriptors> make(const TypeDescription & type) const override {
    return std::make_shared<const OwnerAppender>(type.name);
  }

  bool operator == (const Owner &) const noexcept { return true; }
  size_t hashValue() const noexcept { return 0; }
  std::string toString() const override { return "attributes::Owner"; }
};

inline registry::AppenderFactoryPtr<Descriptors> none() {
  return std::make_shared<const NoOp>();
}

inline registry::AppenderFactoryPtr<Descriptors> annotated(std::vector<std::string> annotations) {
  return std::make_shared<const Annotations>(std::move(annotations));
}

inline registry::AppenderFactoryPtr<Descriptors> owner() {
  return std::make_shared<const Owner>();
}

} // namespace attributes

}
