#pragma once

#include <cstddef>
#include <functional>

namespace hvstat::core {

inline void hash_combine(std::size_t& seed, const std::size_t value) noexcept {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template <typename T>
inline void hash_combine_value(std::size_t& seed, const T& value) {
  hash_combine(seed, std::hash<T>{}(value));
}

}  // namespace hvstat::core
