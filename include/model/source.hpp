#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace hvstat::model {

// Hierarchical location of an observation, e.g. {"disks", "sda"}.
// An empty source means host-wide.
class Source {
 public:
  Source() = default;
  explicit Source(std::vector<std::string> segments);
  Source(std::initializer_list<std::string> segments);

  [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
  explicit operator bool() const noexcept { return !segments_.empty(); }

  // Slash-joined path, "" for the host-wide source.
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::size_t hash() const noexcept { return hash_; }

  friend bool operator==(const Source& lhs, const Source& rhs) noexcept {
    return lhs.hash_ == rhs.hash_ && lhs.segments_ == rhs.segments_;
  }
  friend bool operator!=(const Source& lhs, const Source& rhs) noexcept { return !(lhs == rhs); }

 private:
  static std::size_t compute_hash(const std::vector<std::string>& segments) noexcept;

  std::vector<std::string> segments_{};
  std::size_t hash_{compute_hash({})};
};

}  // namespace hvstat::model

namespace std {

template <>
struct hash<hvstat::model::Source> {
  std::size_t operator()(const hvstat::model::Source& source) const noexcept { return source.hash(); }
};

}  // namespace std
