#pragma once

#include <chrono>
#include <cstdint>

#include "core/differ.hpp"

namespace hvstat::sinks {

enum class block_kind : std::uint8_t {
  INTERVAL = 0,
  TOTAL = 1,
};

// One report: the deltas of a cycle, or the totals since the first
// snapshot when the monitor stops.
struct ReportBlock {
  block_kind kind;
  std::chrono::nanoseconds elapsed;
  const core::DiffResult& diff;
};

class Reporter {
 public:
  virtual ~Reporter() = default;

  virtual void begin(std::chrono::milliseconds interval) = 0;
  virtual void publish(const ReportBlock& block) = 0;
};

}  // namespace hvstat::sinks
