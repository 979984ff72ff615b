#pragma once

#include <cstdio>
#include <string>

#include "core/timestamp.hpp"
#include "model/catalog.hpp"
#include "probes/probe.hpp"
#include "probes/proc_file.hpp"

namespace hvstat::probes {

// /proc/diskstats: sectors read and written per whole disk (minor number 0)
// under {"disks", <device>}. Partitions are skipped.
class DiskProbe final : public Probe {
 public:
  explicit DiskProbe(const std::string& path = "/proc/diskstats", core::Clock clock = core::monotonic_clock(),
                     const model::Catalog& catalog = model::catalog());
  DiskProbe(std::FILE* file, bool owns_file, core::Clock clock = core::monotonic_clock(),
            const model::Catalog& catalog = model::catalog());

  [[nodiscard]] const char* name() const noexcept override { return "disk"; }
  void collect(model::Snapshot& snapshot) override;

 private:
  ProcFile file_;
  core::Clock clock_;
  const model::Catalog& catalog_;
};

}  // namespace hvstat::probes
