#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "sinks/reporter.hpp"

namespace hvstat::sinks {

// "1234567" -> "1,234,567"
std::string group_thousands(std::int64_t value);

// One line per subject whose value grew, ordered by subject; zero and
// negative deltas are left out.
std::vector<std::string> format_report_lines(const core::DiffResult& diff);

class TextReportSink final : public Reporter {
 public:
  explicit TextReportSink(std::FILE* out = stdout);

  void begin(std::chrono::milliseconds interval) override;
  void publish(const ReportBlock& block) override;

 private:
  std::FILE* out_;
};

}  // namespace hvstat::sinks
