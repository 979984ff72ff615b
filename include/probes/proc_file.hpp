#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace hvstat::probes {

// A pseudo-file kept open across cycles and re-read from the start on each
// pass. Opening is retried on every rewind() until it succeeds.
class ProcFile {
 public:
  explicit ProcFile(std::string path);
  ProcFile(std::FILE* file, bool owns_file, std::string label = "<injected>");
  ~ProcFile();

  ProcFile(const ProcFile&) = delete;
  ProcFile& operator=(const ProcFile&) = delete;
  ProcFile(ProcFile&& other) noexcept;
  ProcFile& operator=(ProcFile&& other) noexcept;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  // Throws ProbeError when the file cannot be opened or rewound.
  void rewind();

  // Reads one full line without its trailing newline. Returns false at end
  // of file; throws ProbeError on a read error.
  bool read_line(std::string& line);

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  void close() noexcept;

  std::string path_;
  std::FILE* file_{nullptr};
  bool owns_file_{true};
  int open_errno_{0};
};

std::vector<std::string_view> split_fields(std::string_view line);

bool parse_u64(std::string_view text, std::uint64_t& value) noexcept;

}  // namespace hvstat::probes
