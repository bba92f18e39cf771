#pragma once

#include <string>
#include <sstream>
#include <charconv>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <algorithm>
#include <cctype>

namespace fr::utility {

inline std::string trim(const std::string& s) {
  auto start = s.find_first_not_of(" \t\n\r");
  if (start == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\n\r");
  return s.substr(start, end - start + 1);
}

struct SplitOptions {
  bool trim_tokens = true;
  bool include_empty = false;
};

[[nodiscard]]
inline std::vector<std::string> splitString(const std::string& s, char delimiter, SplitOptions split_opts = SplitOptions()) {
  std::vector<std::string> tokens;
  std::string token;
  std::istringstream tokenStream(s);
  while (std::getline(tokenStream, token, delimiter)) {
    if (split_opts.trim_tokens) token = trim(token);
    if (!token.empty() || split_opts.include_empty) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

inline std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

template <typename T>
T fromString(const std::string& str) {
  if constexpr (std::is_same_v<T, std::string>) {
    return str;
  }
  else if constexpr (std::is_same_v<T, bool>) {
    const std::string s = trim(toLower(str));
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    throw std::invalid_argument("Invalid boolean value: '" + str + "'");
  }
  else if constexpr (std::is_integral_v<T>) {
    T value;
    int base = 10;
    const char* begin = str.data();
    const char* end = begin + str.size();
    if ((str.size() > 2) && (str[0] == '0') && (std::tolower(str[1]) == 'x')) {
      base = 16;
      begin += 2;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value, base);
    if (ec != std::errc() || ptr != end) {
      throw std::invalid_argument("Invalid integral conversion for: " + str);
    }
    return value;
  }
  else if constexpr (std::is_floating_point_v<T>) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != (str.data() + str.size())) {
      throw std::invalid_argument("Invalid numeric conversion for: " + str);
    }
    return value;
  }
  else {
    static_assert(sizeof(T) == 0, "Unsupported type for conversion");
  }
}

} // namespace fr::utility
