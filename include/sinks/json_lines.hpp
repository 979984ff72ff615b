#pragma once

#include <cstdio>

#include <nlohmann/json.hpp>

#include "sinks/reporter.hpp"

namespace hvstat::sinks {

// Serializes a block as one JSON object. Same filter and ordering as the
// text report.
nlohmann::json to_json(const ReportBlock& block);

class JsonLinesSink final : public Reporter {
 public:
  explicit JsonLinesSink(std::FILE* out = stdout);

  void begin(std::chrono::milliseconds interval) override;
  void publish(const ReportBlock& block) override;

 private:
  void write_line(const nlohmann::json& document);

  std::FILE* out_;
};

}  // namespace hvstat::sinks
