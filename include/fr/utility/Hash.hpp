#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fr::utility {

inline constexpr size_t FNV_OFFSET_BASIS = 0xcbf29ce484222325;
inline constexpr size_t FNV_PRIME = 0x100000001b3;

// FNV-1a 64-bit hash algorithm
constexpr size_t fnv1a(std::string_view str) {
  size_t hash = FNV_OFFSET_BASIS;
  for (char chr : str) {
    hash ^= static_cast<size_t>(chr);
    hash *= FNV_PRIME;
  }
  return hash;
}

// Order sensitive: combine(combine(s, a), b) != combine(combine(s, b), a)
constexpr size_t hashCombine(size_t seed, size_t value) {
  seed ^= value;
  seed *= FNV_PRIME;
  return seed;
}

static_assert(fnv1a("ping") == fnv1a("ping"));
static_assert(fnv1a("ping") != fnv1a("pong"));
static_assert(hashCombine(hashCombine(FNV_OFFSET_BASIS, 1), 2) != hashCombine(hashCombine(FNV_OFFSET_BASIS, 2), 1));

}
