#include "model/subject.hpp"

#include <utility>

#include "core/hash.hpp"

namespace hvstat::model {

Subject::Subject(Source source, const Measurable& measurable)
    : source_(std::move(source)), measurable_(&measurable) {}

std::string Subject::to_string() const {
  return "(" + source_.to_string() + ", " + measurable_->to_string() + ")";
}

std::size_t Subject::hash() const noexcept {
  std::size_t seed = source_.hash();
  core::hash_combine_value(seed, measurable_);
  return seed;
}

}  // namespace hvstat::model
