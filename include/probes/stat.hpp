#pragma once

#include <cstdio>
#include <string>

#include "core/timestamp.hpp"
#include "model/catalog.hpp"
#include "probes/probe.hpp"
#include "probes/proc_file.hpp"

namespace hvstat::probes {

// /proc/stat: host-wide interrupt and context switch totals, plus nice,
// system, idle and iowait ticks for every cpu line under {"cpu", <line>}.
class StatProbe final : public Probe {
 public:
  explicit StatProbe(const std::string& path = "/proc/stat", core::Clock clock = core::monotonic_clock(),
                     const model::Catalog& catalog = model::catalog());
  StatProbe(std::FILE* file, bool owns_file, core::Clock clock = core::monotonic_clock(),
            const model::Catalog& catalog = model::catalog());

  [[nodiscard]] const char* name() const noexcept override { return "stat"; }
  void collect(model::Snapshot& snapshot) override;

 private:
  ProcFile file_;
  core::Clock clock_;
  const model::Catalog& catalog_;
};

}  // namespace hvstat::probes
