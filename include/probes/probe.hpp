#pragma once

#include <stdexcept>
#include <string>

#include "model/sample.hpp"

namespace hvstat::probes {

// A data source that could not be opened or read.
class ProbeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Probe {
 public:
  virtual ~Probe() = default;

  [[nodiscard]] virtual const char* name() const noexcept = 0;

  // Appends one sample per counter found in the data source. Throws
  // ProbeError on I/O failure; lines that do not parse are skipped.
  virtual void collect(model::Snapshot& snapshot) = 0;
};

}  // namespace hvstat::probes
