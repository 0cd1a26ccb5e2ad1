#pragma once
#include <cstdint>
#include <string>
#include "model/Cpu.hpp"
#include "model/Memory.hpp"
#include "model/Thermal.hpp"

namespace puls::model {

// Slow-changing facts about the machine.
struct HostInfo {
  std::string hostname;
  std::string kernel;       // uname release
  std::string os_name;      // PRETTY_NAME from os-release
  std::string cpu_model;
  int         cpu_count{0};
  int64_t     boot_time{0}; // epoch seconds
};

struct LoadAverage {
  double one{}, five{}, fifteen{};
};

struct HostSnapshot {
  CpuSnapshot cpu;
  Memory      mem;
  Thermal     thermal;
  bool        has_loadavg{false};
  LoadAverage loadavg;
  uint64_t    uptime_s{0};
  HostInfo    info;
};

} // namespace puls::model
