#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <typeinfo>
#include <type_traits>

#include <fr/type/TypeInfo.hpp>
#include <fr/utility/Hash.hpp>

namespace fr::registry {

// Collaborators taking part in rule equality and in the factory cache.
// equals() and hash() must be consistent with each other.
class Comparable {
public:
  virtual ~Comparable() = default;

  virtual bool equals(const Comparable & other) const noexcept = 0;
  virtual size_t hash() const noexcept = 0;
  virtual std::string toString() const = 0;
};

// Value equality for a concrete collaborator: the dynamic types must match exactly,
// then Derived::operator== decides. Derived supplies hashValue().
template <typename Derived, typename Interface>
class ComparableBase : public Interface {
  static_assert(std::is_base_of_v<Comparable, Interface>, "Interface must derive from Comparable");

public:
  bool equals(const Comparable & other) const noexcept override {
    if (this == &other) {
      return true;
    }
    if (typeid(other) != typeid(Derived)) {
      return false;
    }
    return self() == static_cast<const Derived &>(other);
  }

  size_t hash() const noexcept override {
    return utility::hashCombine(type::TypeInfo<Derived>::name_hash, self().hashValue());
  }

  std::string toString() const override {
    return std::string(type::TypeName<Derived>());
  }

protected:
  const Derived & self() const noexcept { return static_cast<const Derived &>(*this); }
};

template <typename Type>
bool equalHandles(const std::shared_ptr<const Type> & lhs, const std::shared_ptr<const Type> & rhs) noexcept {
  if (lhs == rhs) {
    return true;
  }
  return lhs && rhs && lhs->equals(*rhs);
}

template <typename Type>
size_t hashHandle(const std::shared_ptr<const Type> & handle) noexcept {
  return handle ? handle->hash() : 0;
}

template <typename Type>
std::string describeHandle(const std::shared_ptr<const Type> & handle) {
  return handle ? handle->toString() : std::string("null");
}

}
