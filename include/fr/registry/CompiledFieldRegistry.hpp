#pragma once

#include <concepts>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <fr/registry/Model.hpp>
#include <fr/registry/Matcher.hpp>
#include <fr/registry/Transformer.hpp>
#include <fr/registry/FieldRecord.hpp>
#include <fr/registry/FieldPool.hpp>
#include <fr/utility/Format.hpp>

namespace fr::registry {

// A registry bound to one type. Immutable once built; resolve() only reads and may be
// called concurrently.
template <DescriptorModel Model>
class CompiledFieldRegistry final : public FieldPool<Model> {
public:
  using TypeDescription  = TypeDescriptionOf<Model>;
  using FieldDescription = FieldDescriptionOf<Model>;
  using Value            = typename Model::Value;
  using Record           = FieldRecord<Model>;

  struct Entry {
    ElementMatcherPtr<Model>    matcher;
    AppenderPtr<Model>          appender;
    std::optional<Value>        defaultValue;
    FieldTransformerPtr<Model>  transformer;

    bool matches(const FieldDescription & field) const {
      return matcher->matches(field);
    }

    // The transformer sees the field actually being emitted.
    Record bind(const TypeDescription & type, const FieldDescription & field) const {
      return Record::forExplicit(appender, defaultValue, transformer->transform(type, field));
    }

    bool operator == (const Entry & other) const {
      return equalHandles(matcher, other.matcher)
          && sameAppender(appender, other.appender)
          && defaultValue == other.defaultValue
          && equalHandles(transformer, other.transformer);
    }

    std::string toString() const {
      return frmt::format("Entry{{matcher={}, appender={}, defaultValue={}, transformer={}}}",
        describeHandle(matcher), static_cast<const void *>(appender.get()),
        defaultValue ? Model::describe(*defaultValue) : std::string("none"),
        describeHandle(transformer));
    }
  };

  CompiledFieldRegistry(TypeDescription instrumentedType, std::vector<Entry> entries)
    : _instrumentedType(std::move(instrumentedType)), _entries(std::move(entries))
  {
  }

  // First matching entry wins; later entries are not consulted.
  Record resolve(const FieldDescription & field) const override {
    for (const auto & entry : _entries) {
      if (entry.matches(field)) {
        return entry.bind(_instrumentedType, field);
      }
    }
    return Record::forImplicit(field);
  }

  const TypeDescription & instrumentedType() const noexcept { return _instrumentedType; }
  const std::vector<Entry> & entries() const noexcept { return _entries; }
  size_t size() const noexcept { return _entries.size(); }

  bool operator == (const CompiledFieldRegistry & other) const {
    return _instrumentedType == other._instrumentedType && _entries == other._entries;
  }

  std::string toString() const {
    return frmt::format("CompiledFieldRegistry{{instrumentedType={}, entries=[{}]}}",
      Model::describe(_instrumentedType),
      utility::joinFormatted(_entries, [] (const Entry & entry) { return entry.toString(); }));
  }

private:
  static bool sameAppender(const AppenderPtr<Model> & lhs, const AppenderPtr<Model> & rhs) {
    if (lhs == rhs) {
      return true;
    }
    if constexpr (std::equality_comparable<typename Model::Appender>) {
      return lhs && rhs && *lhs == *rhs;
    }
    else {
      return false;
    }
  }

  TypeDescription     _instrumentedType;
  std::vector<Entry>  _entries;
};

template <DescriptorModel Model>
std::ostream & operator << (std::ostream & os, const CompiledFieldRegistry<Model> & compiled) {
  return os << compiled.toString();
}

}
