#include "model/source.hpp"

#include <utility>

#include "core/hash.hpp"

namespace hvstat::model {

Source::Source(std::vector<std::string> segments)
    : segments_(std::move(segments)), hash_(compute_hash(segments_)) {}

Source::Source(const std::initializer_list<std::string> segments)
    : segments_(segments), hash_(compute_hash(segments_)) {}

std::string Source::to_string() const {
  std::string out;
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i != 0) {
      out.push_back('/');
    }
    out += segments_[i];
  }
  return out;
}

std::size_t Source::compute_hash(const std::vector<std::string>& segments) noexcept {
  std::size_t seed = segments.size();
  for (const auto& segment : segments) {
    core::hash_combine_value(seed, segment);
  }
  return seed;
}

}  // namespace hvstat::model
