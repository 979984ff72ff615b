#include "core/differ.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace hvstat::core {

DiffResult diff(const model::Snapshot& older, const model::Snapshot& newer) {
  const model::SampleIndex older_index = model::index_by_subject(older);
  const model::SampleIndex newer_index = model::index_by_subject(newer);

  DiffResult result{};
  result.deltas.reserve(older_index.size());
  for (const auto& [subject, before] : older_index) {
    const auto it = newer_index.find(subject);
    if (it == newer_index.end()) {
      result.vanished.push_back(subject);
      continue;
    }

    const model::Reading& after = it->second;
    Delta delta{};
    delta.elapsed_ns = static_cast<std::int64_t>(after.timestamp_ns - before.timestamp_ns);
    delta.value = after.value - before.value;
    result.deltas.emplace(subject, delta);
  }

  std::sort(result.vanished.begin(), result.vanished.end(),
            [](const model::Subject& lhs, const model::Subject& rhs) { return lhs.to_string() < rhs.to_string(); });
  return result;
}

std::vector<model::Subject> sorted_subjects(const std::unordered_map<model::Subject, Delta>& deltas) {
  std::vector<std::pair<std::string, model::Subject>> keyed;
  keyed.reserve(deltas.size());
  for (const auto& entry : deltas) {
    keyed.emplace_back(entry.first.to_string(), entry.first);
  }
  std::sort(keyed.begin(), keyed.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::vector<model::Subject> subjects;
  subjects.reserve(keyed.size());
  for (auto& entry : keyed) {
    subjects.push_back(std::move(entry.second));
  }
  return subjects;
}

}  // namespace hvstat::core
