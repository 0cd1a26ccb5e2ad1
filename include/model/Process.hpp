#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace puls::model {

struct ProcSample {
  int32_t  pid{};
  int32_t  ppid{};
  char     state{'?'};      // R, S, D, Z, T, I
  uint64_t utime{};         // jiffies
  uint64_t stime{};         // jiffies
  uint64_t total_time{};    // utime+stime
  uint64_t rss_kb{};
  double   cpu_pct{};       // per-core scale: one busy core is 100
  double   mem_pct{};       // share of MemTotal, 0..100
  // Disk I/O rate from /proc/<pid>/io; unreadable for other users' processes
  bool     has_io{false};
  double   io_read_bps{0.0};
  double   io_write_bps{0.0};
  int64_t  start_time{};    // epoch seconds
  int32_t  threads{};
  std::string user_name;
  std::string name;         // comm
  std::string cmd;          // full command line, comm when empty
};

struct ProcessSnapshot {
  std::vector<ProcSample> processes; // unordered; ProcessTable sorts
  size_t total_processes{};
  size_t state_running{};   // 'R'
  size_t state_sleeping{};  // 'S' + 'D'
  size_t state_zombie{};    // 'Z'
  size_t total_threads{};
  unsigned cpu_count{1};
};

} // namespace puls::model
