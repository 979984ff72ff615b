#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace hvstat::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// Source of sample timestamps; tests substitute a fixed sequence.
using Clock = std::function<std::uint64_t()>;

inline Clock monotonic_clock() { return &monotonic_timestamp_now_ns; }

}  // namespace hvstat::core
