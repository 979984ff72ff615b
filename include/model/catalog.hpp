#pragma once

#include <memory>
#include <string>
#include <vector>

#include "model/measurable.hpp"

namespace hvstat::model {

// Process-wide registry of every quantity the probes report. Built once on
// first use and read-only afterwards; probes hold references into it.
class Catalog {
 public:
  Catalog();

  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  // /proc/stat
  Counter intr;
  Counter ctxt;
  Counter cpu_nice;
  Counter cpu_system;
  Counter cpu_idle;
  Counter cpu_iowait;

  // /proc/vmstat
  Counter pgfault;

  // /proc/diskstats
  Counter disk_read_sectors;
  Counter disk_write_sectors;

  // /proc/net/dev
  Counter net_rx_bytes;
  Counter net_tx_bytes;

  // KVM debugfs counters, in file-read order.
  [[nodiscard]] const std::vector<std::unique_ptr<Counter>>& kvm() const noexcept { return kvm_; }

 private:
  std::vector<std::unique_ptr<Counter>> kvm_;
};

const Catalog& catalog();

}  // namespace hvstat::model
