#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace hvstat::core {

enum class output_format : std::uint8_t {
  TEXT = 0,
  JSON = 1,
};

struct PathConfig {
  std::string proc_root{"/proc"};
  std::string kvm_debugfs{"/sys/kernel/debug/kvm"};
};

struct MonitorConfig {
  std::chrono::milliseconds interval{1000};
  output_format format{output_format::TEXT};
  PathConfig paths{};
  std::unordered_map<std::string, bool> probe_enabled{};

  [[nodiscard]] bool is_probe_enabled(const std::string& name) const;
};

MonitorConfig load_monitor_config(const std::string& path);

const char* to_string(output_format format) noexcept;

}  // namespace hvstat::core
