#include "model/sample.hpp"

#include <utility>

namespace hvstat::model {

Sample::Sample(Subject subject, const std::uint64_t timestamp_ns, const std::int64_t value)
    : subject_(std::move(subject)), reading_{timestamp_ns, value} {}

SampleIndex index_by_subject(const Snapshot& snapshot) {
  SampleIndex index;
  index.reserve(snapshot.size());
  for (const auto& sample : snapshot) {
    auto [subject, reading] = sample.split_by_subject();
    index.insert_or_assign(std::move(subject), reading);
  }
  return index;
}

}  // namespace hvstat::model
