#pragma once
#include <cstdint>
#include <string>

namespace puls::model {

struct FsMount {
  std::string device;      // e.g., /dev/nvme0n1p2
  std::string mountpoint;  // e.g., /
  std::string fstype;      // e.g., ext4, xfs, btrfs
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  uint64_t avail_bytes{};
  double   used_pct{};     // 0..100
};

} // namespace puls::model
