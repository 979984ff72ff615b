#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "model/sample.hpp"

namespace hvstat::core {

struct Delta {
  std::int64_t elapsed_ns{0};
  std::int64_t value{0};
};

inline bool operator==(const Delta& lhs, const Delta& rhs) noexcept {
  return lhs.elapsed_ns == rhs.elapsed_ns && lhs.value == rhs.value;
}

struct DiffResult {
  std::unordered_map<model::Subject, Delta> deltas{};
  // Present in the older snapshot, missing from the newer one (disk or
  // interface removed, probe disabled). Never part of deltas.
  std::vector<model::Subject> vanished{};
};

// Per-subject (newer - older) for every subject present in both snapshots.
// Subjects only in `newer` are dropped. Value deltas are plain signed
// subtraction: a counter that wrapped or reset yields a negative delta.
DiffResult diff(const model::Snapshot& older, const model::Snapshot& newer);

// Keys of `deltas` ordered by Subject::to_string().
std::vector<model::Subject> sorted_subjects(const std::unordered_map<model::Subject, Delta>& deltas);

}  // namespace hvstat::core
