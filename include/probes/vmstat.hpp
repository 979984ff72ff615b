#pragma once

#include <cstdio>
#include <string>

#include "core/timestamp.hpp"
#include "model/catalog.hpp"
#include "probes/probe.hpp"
#include "probes/proc_file.hpp"

namespace hvstat::probes {

// /proc/vmstat: host-wide page fault total.
class VmstatProbe final : public Probe {
 public:
  explicit VmstatProbe(const std::string& path = "/proc/vmstat", core::Clock clock = core::monotonic_clock(),
                       const model::Catalog& catalog = model::catalog());
  VmstatProbe(std::FILE* file, bool owns_file, core::Clock clock = core::monotonic_clock(),
              const model::Catalog& catalog = model::catalog());

  [[nodiscard]] const char* name() const noexcept override { return "vmstat"; }
  void collect(model::Snapshot& snapshot) override;

 private:
  ProcFile file_;
  core::Clock clock_;
  const model::Catalog& catalog_;
};

}  // namespace hvstat::probes
