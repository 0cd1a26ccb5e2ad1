#pragma once
#include "model/Cpu.hpp"

namespace puls::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // First call establishes the baseline; usage is 0 until the second.
  bool sample(puls::model::CpuSnapshot& out);
private:
  puls::model::CpuTimes last_total_{};
  std::vector<puls::model::CpuTimes> last_per_{};
  bool has_last_{false};
  std::string cpu_model_{};
};

} // namespace puls::collectors
