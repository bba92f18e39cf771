#pragma once
#if __GNUC__ < 13
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/core.h>
#include <fmt/chrono.h>
namespace frmt = fmt;
#else
#include <format>
namespace frmt = std;
#endif

#include <string>
#include <string_view>

namespace fr::utility {

// Joins the string form of every element; Describe maps an element to something formattable.
template <typename Range, typename Describe>
std::string joinFormatted(const Range & range, Describe && describe, std::string_view separator = ", ") {
  std::string retval;
  bool first = true;
  for (const auto & item : range) {
    if (!first) {
      retval += separator;
    }
    retval += frmt::format("{}", describe(item));
    first = false;
  }
  return retval;
}

}
