#pragma once

#include <string_view>
#include <concepts>
#include <fr/utility/Hash.hpp>

namespace fr::type {

template <typename Type>
struct TypeInfo {
  static constexpr std::string_view name() {
    std::string_view rawname = __PRETTY_FUNCTION__;

    #ifdef __clang__
      std::string_view prefix = "Type = ";
      std::string_view suffix = "]";
    #else // GCC
      std::string_view prefix = "with Type = ";
      std::string_view suffix = ";"; // GCC often uses ';' before additional template info
      if (rawname.find(prefix) == std::string_view::npos) {
          prefix = "[with T = "; // Fallback for some GCC versions
          suffix = "]";
      }
    #endif

    size_t start = rawname.find(prefix) + prefix.size();
    size_t end = rawname.find(suffix, start);
    if (end == std::string_view::npos) {
      end = rawname.rfind(']');
    }

    std::string_view result = rawname.substr(start, end - start);
    while (!result.empty() && result.back() == ' ') {
      result.remove_suffix(1);
    }

    return result;
  }

  static constexpr size_t name_hash = utility::fnv1a(name());
};

// Collaborators may publish a short display name; otherwise the compiler's spelling is used.
template <typename Type>
constexpr std::string_view TypeName() {
  if constexpr (requires { { Type::display_name } -> std::convertible_to<std::string_view>; }) {
    return static_cast<std::string_view>(Type::display_name);
  }
  else if constexpr (requires { { Type::display_name() } -> std::convertible_to<std::string_view>; }) {
    return Type::display_name();
  }
  else {
    return TypeInfo<Type>::name();
  }
}

static_assert(TypeName<int>() == "int");
static_assert(TypeName<double>() != TypeName<float>());

}
