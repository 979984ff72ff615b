#pragma once

#include <cstdio>
#include <string>

#include "core/timestamp.hpp"
#include "model/catalog.hpp"
#include "probes/probe.hpp"
#include "probes/proc_file.hpp"

namespace hvstat::probes {

// /proc/net/dev: bytes received and transmitted per interface under
// {"net", <interface>}.
class NetworkProbe final : public Probe {
 public:
  explicit NetworkProbe(const std::string& path = "/proc/net/dev", core::Clock clock = core::monotonic_clock(),
                        const model::Catalog& catalog = model::catalog());
  NetworkProbe(std::FILE* file, bool owns_file, core::Clock clock = core::monotonic_clock(),
               const model::Catalog& catalog = model::catalog());

  [[nodiscard]] const char* name() const noexcept override { return "network"; }
  void collect(model::Snapshot& snapshot) override;

 private:
  ProcFile file_;
  core::Clock clock_;
  const model::Catalog& catalog_;
};

}  // namespace hvstat::probes
