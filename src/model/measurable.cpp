#include "model/measurable.hpp"

#include <utility>

namespace hvstat::model {

Measurable::Measurable(std::string name, std::string description, const std::initializer_list<std::string> tags)
    : Measurable(measurable_kind::GAUGE, std::move(name), std::move(description), tags) {}

Measurable::Measurable(const measurable_kind kind, std::string name, std::string description,
                       const std::initializer_list<std::string> tags)
    : kind_(kind), name_(std::move(name)), description_(std::move(description)), tags_(tags) {
  if (description_.empty()) {
    description_ = name_;
  }
}

void Measurable::add_tag(std::string tag) { tags_.insert(std::move(tag)); }

Counter::Counter(std::string name, std::string description, const std::initializer_list<std::string> tags)
    : Measurable(measurable_kind::COUNTER, std::move(name), std::move(description), tags) {}

}  // namespace hvstat::model
