#pragma once
#include <cstddef>
#include <variant>
#include <boost/mp11/list.hpp>
#include <boost/mp11/algorithm.hpp>

namespace fr::type {

using namespace boost::mp11;

template<typename... Args>
struct type_list: boost::mp11::mp_list<Args...> {
  using variant_type = std::variant<Args...>;
};

}
