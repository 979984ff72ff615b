#include "core/monitor.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "probes/disk.hpp"
#include "probes/kvm.hpp"
#include "probes/network.hpp"
#include "probes/stat.hpp"
#include "probes/vmstat.hpp"

namespace hvstat::core {

Monitor::Monitor(const MonitorConfig& config, std::unique_ptr<sinks::Reporter> reporter, Clock clock)
    : Monitor(config.interval, std::move(reporter), std::move(clock)) {
  register_probes(config);
}

Monitor::Monitor(const std::chrono::milliseconds interval, std::unique_ptr<sinks::Reporter> reporter, Clock clock)
    : interval_(interval), reporter_(std::move(reporter)), clock_(std::move(clock)) {
  if (reporter_ == nullptr) {
    throw std::invalid_argument("monitor requires a reporter");
  }
}

void Monitor::register_probes(const MonitorConfig& config) {
  const std::string& proc = config.paths.proc_root;
  std::vector<std::unique_ptr<probes::Probe>> defaults;
  defaults.push_back(std::make_unique<probes::StatProbe>(proc + "/stat", clock_));
  defaults.push_back(std::make_unique<probes::VmstatProbe>(proc + "/vmstat", clock_));
  defaults.push_back(std::make_unique<probes::KvmProbe>(config.paths.kvm_debugfs, clock_));
  defaults.push_back(std::make_unique<probes::DiskProbe>(proc + "/diskstats", clock_));
  defaults.push_back(std::make_unique<probes::NetworkProbe>(proc + "/net/dev", clock_));

  for (auto& probe : defaults) {
    const bool enabled = config.is_probe_enabled(probe->name());
    add_probe(enabled, std::move(probe));
  }
}

void Monitor::add_probe(const bool enabled, std::unique_ptr<probes::Probe> probe) {
  if (started()) {
    throw std::logic_error("probes must be registered before the first snapshot");
  }
  if (probe == nullptr) {
    throw std::invalid_argument("monitor cannot register a null probe");
  }
  std::string name = probe->name();
  probe_registry_.push_back({std::move(name), enabled, std::move(probe)});
}

model::Snapshot Monitor::probe_all() {
  model::Snapshot snapshot;
  for (auto& registration : probe_registry_) {
    if (!registration.enabled) {
      continue;
    }
    registration.probe->collect(snapshot);
  }
  return snapshot;
}

Monitor::TimedSnapshot Monitor::capture() {
  TimedSnapshot taken{};
  taken.samples = probe_all();
  taken.taken_ns = clock_();
  return taken;
}

void Monitor::start() {
  if (started()) {
    return;
  }

  first_ = capture();
  previous_ = *first_;
  next_wakeup_ = std::chrono::steady_clock::now();
  reporter_->begin(interval_);
}

bool Monitor::sleep_until_next_wakeup(const StopCondition& stop_requested) {
  if (!stop_requested) {
    std::this_thread::sleep_until(next_wakeup_);
    return true;
  }

  while (!stop_requested()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= next_wakeup_) {
      return true;
    }
    std::this_thread::sleep_until(std::min(next_wakeup_, now + kStopPollInterval));
  }
  return false;
}

MonitorStats Monitor::run_for_cycles(const std::size_t total_cycles, const StopCondition& stop_requested) {
  start();

  MonitorStats stats{};
  for (std::size_t i = 0; total_cycles == 0 || i < total_cycles; ++i) {
    next_wakeup_ += interval_;
    if (!sleep_until_next_wakeup(stop_requested)) {
      break;
    }

    TimedSnapshot current = capture();
    stats.samples_collected += current.samples.size();
    report(sinks::block_kind::INTERVAL, previous_, current, stats);
    previous_ = std::move(current);

    ++stats.cycles_executed;
  }

  return stats;
}

MonitorStats Monitor::finish() {
  start();

  MonitorStats stats{};
  const TimedSnapshot last = capture();
  stats.samples_collected = last.samples.size();
  report(sinks::block_kind::TOTAL, *first_, last, stats);
  return stats;
}

void Monitor::report(const sinks::block_kind kind, const TimedSnapshot& older, const TimedSnapshot& newer,
                     MonitorStats& stats) {
  const DiffResult result = diff(older.samples, newer.samples);

  for (const auto& subject : result.vanished) {
    std::cerr << "[hvstat] counter vanished: " << subject.to_string() << '\n';
  }
  stats.subjects_vanished += result.vanished.size();
  stats.subjects_diffed += result.deltas.size();

  const auto elapsed = std::chrono::nanoseconds(static_cast<std::int64_t>(newer.taken_ns - older.taken_ns));
  reporter_->publish(sinks::ReportBlock{kind, elapsed, result});
}

const model::Snapshot& Monitor::first_snapshot() const {
  if (!first_.has_value()) {
    throw std::logic_error("monitor has not taken its first snapshot");
  }
  return first_->samples;
}

std::vector<std::string> Monitor::enabled_probe_names() const {
  std::vector<std::string> names;
  for (const auto& registration : probe_registry_) {
    if (registration.enabled) {
      names.push_back(registration.name);
    }
  }
  return names;
}

}  // namespace hvstat::core
