#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/differ.hpp"
#include "core/timestamp.hpp"
#include "model/sample.hpp"
#include "probes/probe.hpp"
#include "sinks/reporter.hpp"

namespace hvstat::core {

struct MonitorStats {
  std::size_t cycles_executed{0};
  std::size_t samples_collected{0};
  std::size_t subjects_diffed{0};
  std::size_t subjects_vanished{0};
};

// Polled while the monitor waits for the next cycle; true ends the wait.
using StopCondition = std::function<bool()>;

// Takes a snapshot per interval, diffs it against the previous one and
// hands the result to the reporter. The first snapshot is kept until the
// monitor is destroyed so finish() can report totals since the beginning.
class Monitor {
 public:
  // Registers the stat, vmstat, kvm, disk and network probes according to
  // `config`.
  Monitor(const MonitorConfig& config, std::unique_ptr<sinks::Reporter> reporter, Clock clock = monotonic_clock());

  // No probes registered; see add_probe().
  Monitor(std::chrono::milliseconds interval, std::unique_ptr<sinks::Reporter> reporter,
          Clock clock = monotonic_clock());

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Registered under probe->name().
  void add_probe(bool enabled, std::unique_ptr<probes::Probe> probe);

  // Every enabled probe once, in registration order. Probe errors
  // propagate.
  model::Snapshot probe_all();

  // Takes and retains the first snapshot. Called implicitly by the first
  // run_for_cycles().
  void start();

  // Runs `total_cycles` cycles, or until `stop_requested` returns true when
  // total_cycles is 0. The stop condition is checked at least every
  // kStopPollInterval while sleeping; a cycle interrupted that way takes no
  // snapshot.
  MonitorStats run_for_cycles(std::size_t total_cycles, const StopCondition& stop_requested = {});

  // Reports the totals between the first snapshot and a fresh one.
  MonitorStats finish();

  [[nodiscard]] bool started() const noexcept { return first_.has_value(); }
  [[nodiscard]] const model::Snapshot& first_snapshot() const;
  [[nodiscard]] std::vector<std::string> enabled_probe_names() const;

 private:
  struct ProbeRegistration {
    std::string name;
    bool enabled;
    std::unique_ptr<probes::Probe> probe;
  };

  struct TimedSnapshot {
    std::uint64_t taken_ns{0};
    model::Snapshot samples{};
  };

  static constexpr std::chrono::milliseconds kStopPollInterval{50};

  void register_probes(const MonitorConfig& config);
  // false when stop_requested fired before the deadline.
  bool sleep_until_next_wakeup(const StopCondition& stop_requested);
  TimedSnapshot capture();
  void report(sinks::block_kind kind, const TimedSnapshot& older, const TimedSnapshot& newer, MonitorStats& stats);

  std::chrono::milliseconds interval_{};
  std::unique_ptr<sinks::Reporter> reporter_;
  Clock clock_;
  std::vector<ProbeRegistration> probe_registry_{};

  std::optional<TimedSnapshot> first_{};
  TimedSnapshot previous_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
};

}  // namespace hvstat::core
