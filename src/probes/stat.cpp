#include "probes/stat.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace hvstat::probes {

StatProbe::StatProbe(const std::string& path, core::Clock clock, const model::Catalog& catalog)
    : file_(path), clock_(std::move(clock)), catalog_(catalog) {}

StatProbe::StatProbe(std::FILE* file, const bool owns_file, core::Clock clock, const model::Catalog& catalog)
    : file_(file, owns_file, "/proc/stat"), clock_(std::move(clock)), catalog_(catalog) {}

void StatProbe::collect(model::Snapshot& snapshot) {
  file_.rewind();
  const std::uint64_t now = clock_();

  // Column of each tick counter on a cpu line, counting the line name as 0.
  const std::array<std::pair<std::size_t, const model::Counter*>, 4> cpu_columns{{
      {2, &catalog_.cpu_nice},
      {3, &catalog_.cpu_system},
      {4, &catalog_.cpu_idle},
      {5, &catalog_.cpu_iowait},
  }};

  std::string line;
  while (file_.read_line(line)) {
    const auto fields = split_fields(line);
    if (fields.size() < 2) {
      continue;
    }

    const std::string_view key = fields[0];
    std::uint64_t value = 0;

    if (key == "intr" || key == "ctxt") {
      if (!parse_u64(fields[1], value)) {
        continue;
      }
      const model::Counter& counter = key == "intr" ? catalog_.intr : catalog_.ctxt;
      snapshot.emplace_back(model::Subject{model::Source{}, counter}, now, static_cast<std::int64_t>(value));
      continue;
    }

    if (key.substr(0, 3) != "cpu" || fields.size() <= cpu_columns.back().first) {
      continue;
    }

    const model::Source source{"cpu", std::string{key}};
    for (const auto& [column, counter] : cpu_columns) {
      if (!parse_u64(fields[column], value)) {
        continue;
      }
      snapshot.emplace_back(model::Subject{source, *counter}, now, static_cast<std::int64_t>(value));
    }
  }
}

}  // namespace hvstat::probes
