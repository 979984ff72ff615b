#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/monitor.hpp"
#include "sinks/json_lines.hpp"
#include "sinks/text_report.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const hvstat::core::MonitorConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[hvstat] config " << (config_path.empty() ? std::string{"<defaults>"} : config_path)
         << " | interval_ms=" << config.interval.count()
         << " | output.format=" << hvstat::core::to_string(config.format)
         << " | proc_root=" << config.paths.proc_root
         << " | kvm_debugfs=" << config.paths.kvm_debugfs;
  return output.str();
}

std::unique_ptr<hvstat::sinks::Reporter> make_reporter(const hvstat::core::output_format format) {
  if (format == hvstat::core::output_format::JSON) {
    return std::make_unique<hvstat::sinks::JsonLinesSink>();
  }
  return std::make_unique<hvstat::sinks::TextReportSink>();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "";

  hvstat::core::MonitorConfig config{};
  if (!config_path.empty()) {
    try {
      config = hvstat::core::load_monitor_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "config error: " << ex.what() << '\n';
      return 1;
    }
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    hvstat::core::Monitor monitor{config, make_reporter(config.format)};

    std::ostringstream probes;
    for (const auto& name : monitor.enabled_probe_names()) {
      probes << ' ' << name;
    }
    std::cerr << "[hvstat] probes:" << probes.str() << '\n';

    monitor.start();
    (void)monitor.run_for_cycles(0, [] { return g_shutdown_requested != 0; });

    std::cerr << "[hvstat] shutdown signal received; reporting totals\n";
    monitor.finish();
  } catch (const std::exception& ex) {
    std::cerr << "[hvstat] fatal: " << ex.what() << '\n';
    return 2;
  }

  return 0;
}
