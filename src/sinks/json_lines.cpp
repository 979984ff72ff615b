#include "sinks/json_lines.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace hvstat::sinks {

namespace {

const char* block_name(const block_kind kind) noexcept {
  return kind == block_kind::TOTAL ? "total" : "interval";
}

double per_second(const core::Delta& delta) noexcept {
  if (delta.elapsed_ns <= 0) {
    return 0.0;
  }
  return static_cast<double>(delta.value) * 1e9 / static_cast<double>(delta.elapsed_ns);
}

}  // namespace

nlohmann::json to_json(const ReportBlock& block) {
  nlohmann::json deltas = nlohmann::json::array();
  for (const auto& subject : core::sorted_subjects(block.diff.deltas)) {
    const core::Delta& delta = block.diff.deltas.at(subject);
    if (delta.value <= 0) {
      continue;
    }

    const auto& measurable = subject.measurable();
    std::vector<std::string> tags(measurable.tags().begin(), measurable.tags().end());
    std::sort(tags.begin(), tags.end());

    nlohmann::json entry = {
        {"measurable", measurable.name()},
        {"source", subject.source().to_string()},
        {"description", measurable.description()},
        {"tags", tags},
        {"delta", delta.value},
        {"per_second", per_second(delta)},
    };
    deltas.push_back(std::move(entry));
  }

  return nlohmann::json{
      {"block", block_name(block.kind)},
      {"elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(block.elapsed).count()},
      {"deltas", std::move(deltas)},
  };
}

JsonLinesSink::JsonLinesSink(std::FILE* out) : out_(out) {}

void JsonLinesSink::begin(const std::chrono::milliseconds interval) {
  write_line(nlohmann::json{{"block", "start"}, {"interval_ms", interval.count()}});
}

void JsonLinesSink::publish(const ReportBlock& block) { write_line(to_json(block)); }

void JsonLinesSink::write_line(const nlohmann::json& document) {
  const std::string line = document.dump();
  std::fprintf(out_, "%s\n", line.c_str());
  std::fflush(out_);
}

}  // namespace hvstat::sinks
