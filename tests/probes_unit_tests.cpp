#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "core/differ.hpp"
#include "model/catalog.hpp"
#include "model/sample.hpp"
#include "probes/disk.hpp"
#include "probes/kvm.hpp"
#include "probes/network.hpp"
#include "probes/proc_file.hpp"
#include "probes/stat.hpp"
#include "probes/vmstat.hpp"

using hvstat::core::Clock;
using hvstat::core::Delta;
using hvstat::model::catalog;
using hvstat::model::Measurable;
using hvstat::model::SampleIndex;
using hvstat::model::Snapshot;
using hvstat::model::Source;
using hvstat::model::Subject;
using hvstat::probes::DiskProbe;
using hvstat::probes::KvmProbe;
using hvstat::probes::NetworkProbe;
using hvstat::probes::ProbeError;
using hvstat::probes::StatProbe;
using hvstat::probes::VmstatProbe;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0) {
    return false;
  }
  if (ftruncate(fd, 0) != 0) {
    return false;
  }
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

// Returns 1000, 2000, 3000, ... on successive calls.
Clock stepping_clock() {
  auto now = std::make_shared<std::uint64_t>(0);
  return [now]() { return *now += 1000; };
}

bool has_value(const SampleIndex& index, const Source& source, const Measurable& measurable, std::int64_t expected) {
  const auto it = index.find(Subject{source, measurable});
  return it != index.end() && it->second.value == expected;
}

int test_stat_probe_parses_cpu_intr_and_ctxt() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file,
                       "cpu  100 20 30 400 50 0 0 0 0 0\n"
                       "cpu0 50 10 15 200 25 0 0 0 0 0\n"
                       "intr 1000 5 6 7\n"
                       "ctxt 2000\n"
                       "btime 1700000000\n"
                       "processes 4242\n")) {
    return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "failed writing proc/stat fixture");
  }

  StatProbe probe(stat_file, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  if (snapshot.size() != 10) {
    return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "expected 4 counters per cpu line plus intr and ctxt");
  }

  const auto& c = catalog();
  const auto index = hvstat::model::index_by_subject(snapshot);
  const Source total{"cpu", "cpu"};
  const Source cpu0{"cpu", "cpu0"};
  if (!has_value(index, total, c.cpu_nice, 20) || !has_value(index, total, c.cpu_system, 30) ||
      !has_value(index, total, c.cpu_idle, 400) || !has_value(index, total, c.cpu_iowait, 50)) {
    return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "aggregate cpu columns mismatch");
  }
  if (!has_value(index, cpu0, c.cpu_idle, 200) || !has_value(index, cpu0, c.cpu_iowait, 25)) {
    return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "per-cpu columns mismatch");
  }
  if (!has_value(index, Source{}, c.intr, 1000) || !has_value(index, Source{}, c.ctxt, 2000)) {
    return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "host-wide scalars mismatch");
  }
  for (const auto& sample : snapshot) {
    if (sample.timestamp_ns() != 1000) {
      return fail("test_stat_probe_parses_cpu_intr_and_ctxt", "all samples of one pass share the observation instant");
    }
  }
  return 0;
}

int test_stat_probe_skips_malformed_lines() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu1 1 2\nintr\nctxt abc\ncpu2 1 2 3 x 5\n")) {
    return fail("test_stat_probe_skips_malformed_lines", "failed writing proc/stat fixture");
  }

  StatProbe probe(stat_file, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  // cpu2 keeps its three parseable columns.
  if (snapshot.size() != 3) {
    return fail("test_stat_probe_skips_malformed_lines", "short or non-numeric fields must be skipped");
  }
  return 0;
}

int test_stat_probe_reads_overlong_lines() {
  std::string intr_line = "intr 777";
  for (int i = 0; i < 600; ++i) {
    intr_line += " 0";
  }

  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, intr_line + "\nctxt 55\n")) {
    return fail("test_stat_probe_reads_overlong_lines", "failed writing proc/stat fixture");
  }

  StatProbe probe(stat_file, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  const auto index = hvstat::model::index_by_subject(snapshot);
  if (snapshot.size() != 2 || !has_value(index, Source{}, catalog().intr, 777) ||
      !has_value(index, Source{}, catalog().ctxt, 55)) {
    return fail("test_stat_probe_reads_overlong_lines", "a long intr line must not leak into the next line");
  }
  return 0;
}

int test_stat_probe_end_to_end_delta() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  100 20 30 400 50\nintr 1000 1 2\n")) {
    return fail("test_stat_probe_end_to_end_delta", "failed writing first proc/stat snapshot");
  }

  StatProbe probe(stat_file, false, stepping_clock());
  Snapshot older;
  probe.collect(older);

  if (!write_temp_file(stat_file, "cpu  110 25 37 460 51\nintr 1500 3 4\n")) {
    return fail("test_stat_probe_end_to_end_delta", "failed writing second proc/stat snapshot");
  }
  Snapshot newer;
  probe.collect(newer);

  const auto& c = catalog();
  const Source cpu{"cpu", "cpu"};
  const auto result = hvstat::core::diff(older, newer);
  if (result.deltas.size() != 5 || !result.vanished.empty()) {
    std::fclose(stat_file);
    return fail("test_stat_probe_end_to_end_delta", "expected exactly five deltas");
  }
  if (!(result.deltas.at(Subject{cpu, c.cpu_nice}) == Delta{1000, 5}) ||
      !(result.deltas.at(Subject{cpu, c.cpu_system}) == Delta{1000, 7}) ||
      !(result.deltas.at(Subject{cpu, c.cpu_idle}) == Delta{1000, 60}) ||
      !(result.deltas.at(Subject{cpu, c.cpu_iowait}) == Delta{1000, 1}) ||
      !(result.deltas.at(Subject{Source{}, c.intr}) == Delta{1000, 500})) {
    std::fclose(stat_file);
    return fail("test_stat_probe_end_to_end_delta", "delta mapping mismatch");
  }

  std::fclose(stat_file);
  return 0;
}

int test_vmstat_probe_reads_pgfault() {
  std::FILE* vmstat = std::tmpfile();
  if (!write_temp_file(vmstat, "nr_free_pages 1000\npgfault 12345\npgmajfault 7\n")) {
    return fail("test_vmstat_probe_reads_pgfault", "failed writing vmstat fixture");
  }

  VmstatProbe probe(vmstat, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  if (snapshot.size() != 1 || !(snapshot[0].subject() == Subject{Source{}, catalog().pgfault}) ||
      snapshot[0].value() != 12345) {
    return fail("test_vmstat_probe_reads_pgfault", "expected a single host-wide pgfault sample");
  }
  return 0;
}

int test_disk_probe_whole_disks_only() {
  std::FILE* diskstats = std::tmpfile();
  if (!write_temp_file(diskstats,
                       "   8       0 sda 100 0 2048 10 200 0 4096 20 0 30 40\n"
                       "   8       1 sda1 90 0 1024 9 180 0 2048 18 0 27 36\n"
                       " 259       0 nvme0n1 5 0 64 1 6 0 128 2 0 3 4 0 0 0 0 0 0\n"
                       " 259       1 nvme0n1p1 5 0 64 1 6 0 128 2 0 3 4 0 0 0 0 0 0\n"
                       "   8      16 sdb 1 2 3\n")) {
    return fail("test_disk_probe_whole_disks_only", "failed writing diskstats fixture");
  }

  DiskProbe probe(diskstats, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  const auto& c = catalog();
  const auto index = hvstat::model::index_by_subject(snapshot);
  if (snapshot.size() != 4) {
    return fail("test_disk_probe_whole_disks_only", "partitions and short lines must be skipped");
  }
  if (!has_value(index, Source{"disks", "sda"}, c.disk_read_sectors, 2048) ||
      !has_value(index, Source{"disks", "sda"}, c.disk_write_sectors, 4096) ||
      !has_value(index, Source{"disks", "nvme0n1"}, c.disk_read_sectors, 64) ||
      !has_value(index, Source{"disks", "nvme0n1"}, c.disk_write_sectors, 128)) {
    return fail("test_disk_probe_whole_disks_only", "sector counters mismatch");
  }
  return 0;
}

int test_network_probe_reads_rx_tx_bytes() {
  std::FILE* netdev = std::tmpfile();
  if (!write_temp_file(netdev,
                       "Inter-|   Receive                                                |  Transmit\n"
                       " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
                       "    lo:    1000      10    0    0    0     0          0         0     1000      10    0    0    0     0       0          0\n"
                       "  eth0:123456 100 0 0 0 0 0 0 654321 90 0 0 0 0 0 0\n"
                       "  bad0: 1 2 3\n")) {
    return fail("test_network_probe_reads_rx_tx_bytes", "failed writing net/dev fixture");
  }

  NetworkProbe probe(netdev, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  const auto& c = catalog();
  const auto index = hvstat::model::index_by_subject(snapshot);
  if (snapshot.size() != 4) {
    return fail("test_network_probe_reads_rx_tx_bytes", "expected two counters per well-formed interface");
  }
  if (!has_value(index, Source{"net", "lo"}, c.net_rx_bytes, 1000) ||
      !has_value(index, Source{"net", "lo"}, c.net_tx_bytes, 1000) ||
      !has_value(index, Source{"net", "eth0"}, c.net_rx_bytes, 123456) ||
      !has_value(index, Source{"net", "eth0"}, c.net_tx_bytes, 654321)) {
    return fail("test_network_probe_reads_rx_tx_bytes", "byte counters mismatch");
  }
  return 0;
}

int test_kvm_probe_reads_counter_files() {
  const auto& kvm = catalog().kvm();
  std::FILE* exits = std::tmpfile();
  std::FILE* io_exits = std::tmpfile();
  std::FILE* garbage = std::tmpfile();
  if (!write_temp_file(exits, "42\n") || !write_temp_file(io_exits, "7\n") || !write_temp_file(garbage, "n/a\n")) {
    return fail("test_kvm_probe_reads_counter_files", "failed writing kvm fixtures");
  }

  KvmProbe probe({{kvm[0].get(), exits}, {kvm[1].get(), io_exits}, {kvm[2].get(), garbage}}, true, stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);

  const auto index = hvstat::model::index_by_subject(snapshot);
  if (snapshot.size() != 2 || !has_value(index, Source{"kvm"}, *kvm[0], 42) ||
      !has_value(index, Source{"kvm"}, *kvm[1], 7)) {
    return fail("test_kvm_probe_reads_counter_files", "kvm scalars mismatch");
  }

  if (!write_temp_file(exits, "50\n")) {
    return fail("test_kvm_probe_reads_counter_files", "failed rewriting kvm fixture");
  }
  Snapshot again;
  probe.collect(again);
  if (again.size() != 2 || again[0].value() != 50 || again[0].timestamp_ns() != 2000) {
    return fail("test_kvm_probe_reads_counter_files", "kvm files must be re-read from the start each pass");
  }
  return 0;
}

int test_kvm_probe_reads_from_directory() {
  const auto dir = std::filesystem::temp_directory_path() / "hvstat_kvm_fixture";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  for (const auto& counter : catalog().kvm()) {
    std::ofstream out(dir / counter->name());
    out << (counter->name() == "exits" ? "1234\n" : "0\n");
  }

  KvmProbe probe(dir.string(), stepping_clock());
  Snapshot snapshot;
  probe.collect(snapshot);
  std::filesystem::remove_all(dir);

  const auto index = hvstat::model::index_by_subject(snapshot);
  if (snapshot.size() != catalog().kvm().size() || !has_value(index, Source{"kvm"}, *catalog().kvm()[0], 1234)) {
    return fail("test_kvm_probe_reads_from_directory", "expected one sample per registered KVM counter");
  }
  return 0;
}

int test_kvm_counters_reread_after_external_rewrite() {
  const auto dir = std::filesystem::temp_directory_path() / "hvstat_kvm_rewrite";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto write_all = [&dir](const char* content) {
    for (const auto& counter : catalog().kvm()) {
      std::ofstream out(dir / counter->name(), std::ios::trunc);
      out << content;
    }
  };

  write_all("100\n");
  KvmProbe probe(dir.string(), stepping_clock());
  Snapshot first;
  probe.collect(first);

  write_all("250\n");
  Snapshot second;
  probe.collect(second);
  std::filesystem::remove_all(dir);

  const auto& exits = *catalog().kvm()[0];
  const auto older = hvstat::model::index_by_subject(first);
  const auto newer = hvstat::model::index_by_subject(second);
  if (!has_value(older, Source{"kvm"}, exits, 100) || !has_value(newer, Source{"kvm"}, exits, 250)) {
    return fail("test_kvm_counters_reread_after_external_rewrite", "second pass must see the rewritten value");
  }

  const auto result = hvstat::core::diff(first, second);
  if (result.deltas.size() != catalog().kvm().size() ||
      !(result.deltas.at(Subject{Source{"kvm"}, exits}) == Delta{1000, 150})) {
    return fail("test_kvm_counters_reread_after_external_rewrite", "kvm deltas must reflect the rewrite");
  }
  return 0;
}

int test_missing_sources_raise_probe_errors() {
  const auto missing = std::filesystem::temp_directory_path() / "hvstat_missing_dir";
  std::filesystem::remove_all(missing);

  bool stat_threw = false;
  try {
    StatProbe probe((missing / "stat").string(), stepping_clock());
    Snapshot snapshot;
    probe.collect(snapshot);
  } catch (const ProbeError& ex) {
    stat_threw = std::string(ex.what()).find("hvstat_missing_dir/stat") != std::string::npos;
  }
  if (!stat_threw) {
    return fail("test_missing_sources_raise_probe_errors", "unreadable stat file must raise a ProbeError naming it");
  }

  bool kvm_threw = false;
  try {
    KvmProbe probe(missing.string(), stepping_clock());
    Snapshot snapshot;
    probe.collect(snapshot);
  } catch (const ProbeError&) {
    kvm_threw = true;
  }
  if (!kvm_threw) {
    return fail("test_missing_sources_raise_probe_errors", "missing debugfs directory must raise a ProbeError");
  }

  bool null_threw = false;
  try {
    DiskProbe probe(static_cast<std::FILE*>(nullptr), false, stepping_clock());
    Snapshot snapshot;
    probe.collect(snapshot);
  } catch (const ProbeError&) {
    null_threw = true;
  }
  if (!null_threw) {
    return fail("test_missing_sources_raise_probe_errors", "a null injected file must raise a ProbeError");
  }
  return 0;
}

int test_split_fields_and_parse_u64() {
  const auto fields = hvstat::probes::split_fields("  a\tbb   ccc ");
  if (fields.size() != 3 || fields[0] != "a" || fields[1] != "bb" || fields[2] != "ccc") {
    return fail("test_split_fields_and_parse_u64", "whitespace splitting mismatch");
  }

  std::uint64_t value = 0;
  if (!hvstat::probes::parse_u64("18446744073709551615", value) || value != 18446744073709551615ULL) {
    return fail("test_split_fields_and_parse_u64", "max u64 must parse");
  }
  if (hvstat::probes::parse_u64("12x", value) || hvstat::probes::parse_u64("", value) ||
      hvstat::probes::parse_u64("-1", value)) {
    return fail("test_split_fields_and_parse_u64", "partial or signed numbers must be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_stat_probe_parses_cpu_intr_and_ctxt(); rc != 0) return rc;
  if (int rc = test_stat_probe_skips_malformed_lines(); rc != 0) return rc;
  if (int rc = test_stat_probe_reads_overlong_lines(); rc != 0) return rc;
  if (int rc = test_stat_probe_end_to_end_delta(); rc != 0) return rc;
  if (int rc = test_vmstat_probe_reads_pgfault(); rc != 0) return rc;
  if (int rc = test_disk_probe_whole_disks_only(); rc != 0) return rc;
  if (int rc = test_network_probe_reads_rx_tx_bytes(); rc != 0) return rc;
  if (int rc = test_kvm_probe_reads_counter_files(); rc != 0) return rc;
  if (int rc = test_kvm_probe_reads_from_directory(); rc != 0) return rc;
  if (int rc = test_kvm_counters_reread_after_external_rewrite(); rc != 0) return rc;
  if (int rc = test_missing_sources_raise_probe_errors(); rc != 0) return rc;
  if (int rc = test_split_fields_and_parse_u64(); rc != 0) return rc;

  std::cout << "[PASS] probe unit tests\n";
  return 0;
}
