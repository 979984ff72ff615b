#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_set>

namespace hvstat::model {

enum class measurable_kind : std::uint8_t {
  GAUGE = 0,
  COUNTER = 1,
};

// A named class of quantity. Identity is the object itself: build each one
// once (see model/catalog.hpp) and hand out references. Description and
// tags never take part in equality.
class Measurable {
 public:
  explicit Measurable(std::string name, std::string description = {},
                      std::initializer_list<std::string> tags = {});
  virtual ~Measurable() = default;

  Measurable(const Measurable&) = delete;
  Measurable& operator=(const Measurable&) = delete;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& description() const noexcept { return description_; }
  [[nodiscard]] const std::unordered_set<std::string>& tags() const noexcept { return tags_; }
  [[nodiscard]] bool has_tag(const std::string& tag) const { return tags_.count(tag) != 0; }

  [[nodiscard]] bool is_counter() const noexcept { return kind_ == measurable_kind::COUNTER; }

  void add_tag(std::string tag);

  [[nodiscard]] const std::string& to_string() const noexcept { return name_; }

 protected:
  Measurable(measurable_kind kind, std::string name, std::string description,
             std::initializer_list<std::string> tags);

 private:
  measurable_kind kind_{measurable_kind::GAUGE};
  std::string name_;
  std::string description_;
  std::unordered_set<std::string> tags_;
};

// Monotonically non-decreasing over the lifetime of its source. Deltas
// between two samples of a Counter are only meaningful under that contract;
// nothing here enforces it.
class Counter final : public Measurable {
 public:
  explicit Counter(std::string name, std::string description = {},
                   std::initializer_list<std::string> tags = {});
};

}  // namespace hvstat::model
