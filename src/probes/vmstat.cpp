#include "probes/vmstat.hpp"

#include <cstdint>
#include <utility>

namespace hvstat::probes {

VmstatProbe::VmstatProbe(const std::string& path, core::Clock clock, const model::Catalog& catalog)
    : file_(path), clock_(std::move(clock)), catalog_(catalog) {}

VmstatProbe::VmstatProbe(std::FILE* file, const bool owns_file, core::Clock clock, const model::Catalog& catalog)
    : file_(file, owns_file, "/proc/vmstat"), clock_(std::move(clock)), catalog_(catalog) {}

void VmstatProbe::collect(model::Snapshot& snapshot) {
  file_.rewind();
  const std::uint64_t now = clock_();

  std::string line;
  while (file_.read_line(line)) {
    const auto fields = split_fields(line);
    if (fields.size() != 2 || fields[0] != "pgfault") {
      continue;
    }

    std::uint64_t value = 0;
    if (parse_u64(fields[1], value)) {
      snapshot.emplace_back(model::Subject{model::Source{}, catalog_.pgfault}, now, static_cast<std::int64_t>(value));
    }
  }
}

}  // namespace hvstat::probes
