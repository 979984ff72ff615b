#include "probes/disk.hpp"

#include <cstdint>
#include <utility>

namespace hvstat::probes {

namespace {

// major minor name reads merged sectors_read ms writes merged sectors_written ms in_flight io_ms weighted_ms
constexpr std::size_t kMinFields = 14;
constexpr std::size_t kMinorColumn = 1;
constexpr std::size_t kNameColumn = 2;
constexpr std::size_t kSectorsReadColumn = 5;
constexpr std::size_t kSectorsWrittenColumn = 9;

}  // namespace

DiskProbe::DiskProbe(const std::string& path, core::Clock clock, const model::Catalog& catalog)
    : file_(path), clock_(std::move(clock)), catalog_(catalog) {}

DiskProbe::DiskProbe(std::FILE* file, const bool owns_file, core::Clock clock, const model::Catalog& catalog)
    : file_(file, owns_file, "/proc/diskstats"), clock_(std::move(clock)), catalog_(catalog) {}

void DiskProbe::collect(model::Snapshot& snapshot) {
  file_.rewind();
  const std::uint64_t now = clock_();

  std::string line;
  while (file_.read_line(line)) {
    const auto fields = split_fields(line);
    if (fields.size() < kMinFields || fields[kMinorColumn] != "0") {
      continue;
    }

    std::uint64_t sectors_read = 0;
    std::uint64_t sectors_written = 0;
    if (!parse_u64(fields[kSectorsReadColumn], sectors_read) ||
        !parse_u64(fields[kSectorsWrittenColumn], sectors_written)) {
      continue;
    }

    const model::Source source{"disks", std::string{fields[kNameColumn]}};
    snapshot.emplace_back(model::Subject{source, catalog_.disk_read_sectors}, now,
                          static_cast<std::int64_t>(sectors_read));
    snapshot.emplace_back(model::Subject{source, catalog_.disk_write_sectors}, now,
                          static_cast<std::int64_t>(sectors_written));
  }
}

}  // namespace hvstat::probes
