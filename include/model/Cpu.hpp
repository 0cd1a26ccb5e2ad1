#pragma once
#include <cstdint>
#include <vector>
#include <string>

namespace puls::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSnapshot {
  CpuTimes total_times{};
  std::vector<CpuTimes> per_core;
  double usage_pct{};               // aggregate percent 0..100
  std::vector<double> per_core_pct;
  std::string model;                // CPU model name (static)
  int logical_threads{0};
};

} // namespace puls::model
