#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "core/timestamp.hpp"
#include "model/catalog.hpp"
#include "probes/probe.hpp"
#include "probes/proc_file.hpp"

namespace hvstat::probes {

// One scalar per KVM debugfs counter file, all under {"kvm"}.
class KvmProbe final : public Probe {
 public:
  struct CounterSource {
    const model::Counter* counter;
    std::FILE* file;
  };

  explicit KvmProbe(const std::string& directory = "/sys/kernel/debug/kvm",
                    core::Clock clock = core::monotonic_clock(),
                    const model::Catalog& catalog = model::catalog());
  KvmProbe(const std::vector<CounterSource>& sources, bool owns_files, core::Clock clock = core::monotonic_clock());

  [[nodiscard]] const char* name() const noexcept override { return "kvm"; }
  void collect(model::Snapshot& snapshot) override;

 private:
  struct CounterFile {
    const model::Counter* counter;
    ProcFile file;
  };

  std::vector<CounterFile> counters_{};
  core::Clock clock_;
};

}  // namespace hvstat::probes
