#pragma once

#include <fr/registry/Model.hpp>
#include <fr/registry/FieldRecord.hpp>

namespace fr::registry {

// Dispatch surface consumed while the fields of a type are emitted.
template <DescriptorModel Model>
class FieldPool {
public:
  using FieldDescription = FieldDescriptionOf<Model>;

  virtual ~FieldPool() = default;

  virtual FieldRecord<Model> resolve(const FieldDescription & field) const = 0;
};

// Configures nothing: every field is passed through unchanged.
template <DescriptorModel Model>
class NoOpFieldPool final : public FieldPool<Model> {
public:
  FieldRecord<Model> resolve(const FieldDescriptionOf<Model> & field) const override {
    return FieldRecord<Model>::forImplicit(field);
  }
};

}
