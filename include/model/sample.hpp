#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "model/subject.hpp"

namespace hvstat::model {

// Timestamp (monotonic clock, ns) and value of one observation.
struct Reading {
  std::uint64_t timestamp_ns{0};
  std::int64_t value{0};
};

inline bool operator==(const Reading& lhs, const Reading& rhs) noexcept {
  return lhs.timestamp_ns == rhs.timestamp_ns && lhs.value == rhs.value;
}

class Sample {
 public:
  Sample(Subject subject, std::uint64_t timestamp_ns, std::int64_t value);

  [[nodiscard]] const Subject& subject() const noexcept { return subject_; }
  [[nodiscard]] std::uint64_t timestamp_ns() const noexcept { return reading_.timestamp_ns; }
  [[nodiscard]] std::int64_t value() const noexcept { return reading_.value; }
  [[nodiscard]] const Reading& reading() const noexcept { return reading_; }

  [[nodiscard]] std::pair<Subject, Reading> split_by_subject() const { return {subject_, reading_}; }

 private:
  Subject subject_;
  Reading reading_;
};

// All samples from one pass over every enabled probe, in probe order.
using Snapshot = std::vector<Sample>;

using SampleIndex = std::unordered_map<Subject, Reading>;

// Keys a snapshot by subject. A subject that occurs more than once keeps
// the reading of its last occurrence.
SampleIndex index_by_subject(const Snapshot& snapshot);

}  // namespace hvstat::model
