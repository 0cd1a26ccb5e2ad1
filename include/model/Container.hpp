#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace puls::model {

enum class ContainerHealth { None, Starting, Healthy, Unhealthy };

const char* to_string(ContainerHealth h);

struct ContainerEntry {
  std::string id;        // 12-char short id
  std::string name;
  std::string image;
  std::string state;     // running, exited, paused, ...
  std::string status;    // engine's human text, e.g. "Up 3 hours (healthy)"
  std::string ports;     // "8080:80, 443" or "none"
  ContainerHealth health{ContainerHealth::None};

  // Resource usage; only meaningful when has_stats is set (running containers)
  bool     has_stats{false};
  double   cpu_pct{0.0};
  uint64_t mem_used_bytes{0};
  uint64_t mem_limit_bytes{0};
  double   net_rx_bps{0.0};
  double   net_tx_bps{0.0};
  double   blk_read_bps{0.0};
  double   blk_write_bps{0.0};
};

using ContainerList = std::vector<ContainerEntry>;

} // namespace puls::model
