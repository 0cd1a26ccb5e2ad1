#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace puls::model {

// One physical (or otherwise non-virtual) interface from /proc/net/dev.
struct NetInterface {
  std::string name;
  std::string kind;         // ethernet, wireless, loopback, other
  bool        up{false};    // operstate "up" (or "unknown" with carrier)
  uint64_t    rx_total{};   // cumulative bytes
  uint64_t    tx_total{};
  uint64_t    rx_packets{};
  uint64_t    tx_packets{};
  uint64_t    rx_errors{};
  uint64_t    tx_errors{};
  double      rx_bps{};     // 0 on the first sample and after a counter reset
  double      tx_bps{};
};

struct NetSnapshot {
  std::vector<NetInterface> interfaces;
  double agg_rx_bps{};
  double agg_tx_bps{};
};

} // namespace puls::model
