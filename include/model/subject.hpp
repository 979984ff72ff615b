#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "model/measurable.hpp"
#include "model/source.hpp"

namespace hvstat::model {

// "This kind of quantity at this location": the key that correlates
// samples across snapshots. The measurable must outlive every subject that
// refers to it; catalog entries live for the whole process.
class Subject {
 public:
  Subject(Source source, const Measurable& measurable);

  [[nodiscard]] const Source& source() const noexcept { return source_; }
  [[nodiscard]] const Measurable& measurable() const noexcept { return *measurable_; }

  // "(cpu/cpu0, cpu_idle)"
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::size_t hash() const noexcept;

  friend bool operator==(const Subject& lhs, const Subject& rhs) noexcept {
    return lhs.measurable_ == rhs.measurable_ && lhs.source_ == rhs.source_;
  }
  friend bool operator!=(const Subject& lhs, const Subject& rhs) noexcept { return !(lhs == rhs); }

 private:
  Source source_;
  const Measurable* measurable_;
};

}  // namespace hvstat::model

namespace std {

template <>
struct hash<hvstat::model::Subject> {
  std::size_t operator()(const hvstat::model::Subject& subject) const noexcept { return subject.hash(); }
};

}  // namespace std
