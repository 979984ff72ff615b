#include "sinks/text_report.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace hvstat::sinks {

namespace {

constexpr std::size_t kLabelWidth = 56;
constexpr std::size_t kValueWidth = 16;

double to_seconds(const std::chrono::nanoseconds elapsed) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(elapsed).count();
}

}  // namespace

std::string group_thousands(const std::int64_t value) {
  // Magnitude as unsigned so INT64_MIN does not overflow.
  const std::uint64_t magnitude =
      value < 0 ? static_cast<std::uint64_t>(-(value + 1)) + 1U : static_cast<std::uint64_t>(value);
  const std::string digits = std::to_string(magnitude);

  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  if (value < 0) {
    out.push_back('-');
  }
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

std::vector<std::string> format_report_lines(const core::DiffResult& diff) {
  std::vector<std::string> lines;
  for (const auto& subject : core::sorted_subjects(diff.deltas)) {
    const core::Delta& delta = diff.deltas.at(subject);
    if (delta.value <= 0) {
      continue;
    }

    std::string label = subject.measurable().description();
    if (subject.source()) {
      label += " (" + subject.source().to_string() + ")";
    }

    const std::string value = group_thousands(delta.value);
    std::string line = "  " + label;
    line.append(label.size() < kLabelWidth ? kLabelWidth - label.size() : 0, ' ');
    line.push_back(' ');
    line.append(value.size() < kValueWidth ? kValueWidth - value.size() : 0, ' ');
    line += value;
    lines.push_back(std::move(line));
  }
  return lines;
}

TextReportSink::TextReportSink(std::FILE* out) : out_(out) {}

void TextReportSink::begin(const std::chrono::milliseconds interval) {
  std::fprintf(out_, "hvstat: counters that changed, every %lld ms (interrupt for totals since the beginning)\n",
               static_cast<long long>(interval.count()));
  std::fflush(out_);
}

void TextReportSink::publish(const ReportBlock& block) {
  if (block.kind == block_kind::TOTAL) {
    std::fprintf(out_, "\n--- since the beginning (%.2fs)\n", to_seconds(block.elapsed));
  } else {
    std::fprintf(out_, "\n--- +%.2fs\n", to_seconds(block.elapsed));
  }

  for (const auto& line : format_report_lines(block.diff)) {
    std::fprintf(out_, "%s\n", line.c_str());
  }
  std::fflush(out_);
}

}  // namespace hvstat::sinks
