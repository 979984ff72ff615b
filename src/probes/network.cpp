#include "probes/network.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace hvstat::probes {

namespace {

// Receive: bytes packets errs drop fifo frame compressed multicast
// Transmit: bytes packets errs drop fifo colls carrier compressed
constexpr std::size_t kRxBytesColumn = 0;
constexpr std::size_t kTxBytesColumn = 8;

std::string_view trim_spaces(std::string_view text) noexcept {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

NetworkProbe::NetworkProbe(const std::string& path, core::Clock clock, const model::Catalog& catalog)
    : file_(path), clock_(std::move(clock)), catalog_(catalog) {}

NetworkProbe::NetworkProbe(std::FILE* file, const bool owns_file, core::Clock clock, const model::Catalog& catalog)
    : file_(file, owns_file, "/proc/net/dev"), clock_(std::move(clock)), catalog_(catalog) {}

void NetworkProbe::collect(model::Snapshot& snapshot) {
  file_.rewind();
  const std::uint64_t now = clock_();

  std::string line;
  while (file_.read_line(line)) {
    // The two header lines carry no colon.
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }

    const std::string_view iface = trim_spaces(std::string_view{line}.substr(0, colon));
    const auto fields = split_fields(std::string_view{line}.substr(colon + 1));
    if (iface.empty() || fields.size() <= kTxBytesColumn) {
      continue;
    }

    std::uint64_t rx_bytes = 0;
    std::uint64_t tx_bytes = 0;
    if (!parse_u64(fields[kRxBytesColumn], rx_bytes) || !parse_u64(fields[kTxBytesColumn], tx_bytes)) {
      continue;
    }

    const model::Source source{"net", std::string{iface}};
    snapshot.emplace_back(model::Subject{source, catalog_.net_rx_bytes}, now, static_cast<std::int64_t>(rx_bytes));
    snapshot.emplace_back(model::Subject{source, catalog_.net_tx_bytes}, now, static_cast<std::int64_t>(tx_bytes));
  }
}

}  // namespace hvstat::probes
