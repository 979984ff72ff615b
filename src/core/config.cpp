#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hvstat::core {
namespace {

constexpr long long kMaxIntervalMs = 3'600'000;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
  const std::string lower = to_lower(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean, got '" + value + "'");
}

std::string strip_trailing_slashes(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

void apply_key_value(MonitorConfig& config, const std::string& key, const std::string& value) {
  if (key == "interval_ms") {
    std::size_t consumed = 0;
    const auto ms = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::runtime_error("interval_ms must be an integer");
    }
    if (ms <= 0) {
      throw std::runtime_error("interval_ms must be greater than 0");
    }
    if (ms > kMaxIntervalMs) {
      throw std::runtime_error("interval_ms must be less than or equal to 3600000");
    }
    config.interval = std::chrono::milliseconds(ms);
    return;
  }

  if (key == "output.format") {
    const std::string lower = to_lower(value);
    if (lower == "text") {
      config.format = output_format::TEXT;
    } else if (lower == "json") {
      config.format = output_format::JSON;
    } else {
      throw std::runtime_error("output.format must be 'text' or 'json'");
    }
    return;
  }

  if (key == "paths.proc_root") {
    config.paths.proc_root = strip_trailing_slashes(value);
    return;
  }

  if (key == "paths.kvm_debugfs") {
    config.paths.kvm_debugfs = strip_trailing_slashes(value);
    return;
  }

  if (key.rfind("probes.", 0) == 0) {
    const std::string probe_name = key.substr(std::string("probes.").size());
    config.probe_enabled[probe_name] = parse_bool(key, value);
  }
}

}  // namespace

bool MonitorConfig::is_probe_enabled(const std::string& name) const {
  const auto it = probe_enabled.find(name);
  if (it == probe_enabled.end()) {
    return true;
  }
  return it->second;
}

MonitorConfig load_monitor_config(const std::string& path) {
  MonitorConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth);
        sections.push_back(key);
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

const char* to_string(const output_format format) noexcept {
  switch (format) {
    case output_format::TEXT:
      return "text";
    case output_format::JSON:
      return "json";
  }
  return "text";
}

}  // namespace hvstat::core
