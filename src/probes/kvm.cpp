#include "probes/kvm.hpp"

#include <cstdint>
#include <utility>

namespace hvstat::probes {

KvmProbe::KvmProbe(const std::string& directory, core::Clock clock, const model::Catalog& catalog)
    : clock_(std::move(clock)) {
  counters_.reserve(catalog.kvm().size());
  for (const auto& counter : catalog.kvm()) {
    counters_.push_back({counter.get(), ProcFile{directory + "/" + counter->name()}});
  }
}

KvmProbe::KvmProbe(const std::vector<CounterSource>& sources, const bool owns_files, core::Clock clock)
    : clock_(std::move(clock)) {
  counters_.reserve(sources.size());
  for (const auto& source : sources) {
    counters_.push_back({source.counter, ProcFile{source.file, owns_files, "kvm/" + source.counter->name()}});
  }
}

void KvmProbe::collect(model::Snapshot& snapshot) {
  const std::uint64_t now = clock_();
  const model::Source source{"kvm"};

  std::string line;
  for (auto& entry : counters_) {
    entry.file.rewind();
    if (!entry.file.read_line(line)) {
      continue;
    }

    const auto fields = split_fields(line);
    std::uint64_t value = 0;
    if (fields.size() != 1 || !parse_u64(fields[0], value)) {
      continue;
    }
    snapshot.emplace_back(model::Subject{source, *entry.counter}, now, static_cast<std::int64_t>(value));
  }
}

}  // namespace hvstat::probes
