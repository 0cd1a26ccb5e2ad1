#pragma once
#include "model/Disk.hpp"
#include <string>
#include <unordered_map>

namespace puls::collectors {

// Block device throughput from /proc/diskstats deltas.
class DiskCollector {
public:
  bool sample(puls::model::DiskSnapshot& out);
private:
  struct Prev { uint64_t rdsec{}, wrsec{}, tios{}; double ts{}; };
  std::unordered_map<std::string, Prev> last_;
  static constexpr uint64_t kSectorSize = 512; // diskstats always counts 512-byte sectors
};

} // namespace puls::collectors
