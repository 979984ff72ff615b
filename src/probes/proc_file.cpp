#include "probes/proc_file.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <system_error>
#include <utility>

#include "probes/probe.hpp"

namespace hvstat::probes {

ProcFile::ProcFile(std::string path) : path_(std::move(path)), file_(std::fopen(path_.c_str(), "r")), owns_file_(true) {
  if (file_ == nullptr) {
    open_errno_ = errno;
  }
}

ProcFile::ProcFile(std::FILE* file, const bool owns_file, std::string label)
    : path_(std::move(label)), file_(file), owns_file_(owns_file) {}

ProcFile::~ProcFile() { close(); }

ProcFile::ProcFile(ProcFile&& other) noexcept
    : path_(std::move(other.path_)),
      file_(std::exchange(other.file_, nullptr)),
      owns_file_(other.owns_file_),
      open_errno_(other.open_errno_) {}

ProcFile& ProcFile::operator=(ProcFile&& other) noexcept {
  if (this != &other) {
    close();
    path_ = std::move(other.path_);
    file_ = std::exchange(other.file_, nullptr);
    owns_file_ = other.owns_file_;
    open_errno_ = other.open_errno_;
  }
  return *this;
}

void ProcFile::close() noexcept {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
  file_ = nullptr;
}

void ProcFile::rewind() {
  if (file_ == nullptr && owns_file_) {
    file_ = std::fopen(path_.c_str(), "r");
    if (file_ == nullptr) {
      open_errno_ = errno;
    }
  }

  if (file_ == nullptr) {
    const int err = open_errno_ != 0 ? open_errno_ : EBADF;
    throw ProbeError("unable to open " + path_ + ": " + std::strerror(err));
  }

  // Drop whatever stdio still buffers from the last pass; otherwise a file
  // that was not read to EOF is served from the stale buffer after fseek.
  if (std::fflush(file_) != 0) {
    throw ProbeError("unable to discard buffered input of " + path_ + ": " + std::strerror(errno));
  }
  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    throw ProbeError("unable to rewind " + path_ + ": " + std::strerror(errno));
  }
  std::clearerr(file_);
}

bool ProcFile::read_line(std::string& line) {
  line.clear();
  if (file_ == nullptr) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file_) != nullptr) {
    line += buffer;
    if (!line.empty() && line.back() == '\n') {
      line.pop_back();
      return true;
    }
  }

  if (std::ferror(file_) != 0) {
    const int err = errno;
    std::clearerr(file_);
    throw ProbeError("read error on " + path_ + ": " + std::strerror(err));
  }

  // Last line without a trailing newline.
  return !line.empty();
}

std::vector<std::string_view> split_fields(const std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t') {
      ++pos;
    }
    if (pos > start) {
      fields.push_back(line.substr(start, pos - start));
    }
  }
  return fields;
}

bool parse_u64(const std::string_view text, std::uint64_t& value) noexcept {
  if (text.empty()) {
    return false;
  }
  const char* const end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  return ec == std::errc{} && ptr == end;
}

}  // namespace hvstat::probes
