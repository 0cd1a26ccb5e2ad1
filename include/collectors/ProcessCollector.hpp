#pragma once
#include "model/Process.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace puls::collectors {

// Full /proc scan. Every call rebuilds the process list from scratch; only
// the per-pid counters needed for rate deltas persist between calls.
class ProcessCollector {
public:
  ProcessCollector() = default;
  bool sample(puls::model::ProcessSnapshot& out);

  // Kernel threads and common system daemons, by name prefix.
  static bool is_system_process(std::string_view name);

private:
  struct StatFields {
    char state{'?'};
    int32_t ppid{};
    uint64_t utime{}, stime{};
    int32_t threads{};
    uint64_t starttime{};   // jiffies after boot
    uint64_t vsize{};       // bytes
    int64_t rss_pages{};
    std::string comm;
  };
  struct IoPrev { uint64_t starttime{}; uint64_t rd{}, wr{}; double ts{}; };

  static bool parse_stat(const std::string& content, StatFields& out);
  static std::string read_cmdline(int32_t pid);
  const std::string& user_name(uint32_t uid);
  bool read_status(int32_t pid, uint32_t& uid);

  std::unordered_map<int32_t, std::pair<uint64_t, uint64_t>> last_cpu_{}; // pid -> (starttime, total_time)
  std::unordered_map<int32_t, IoPrev> last_io_{};
  std::unordered_map<uint32_t, std::string> users_{};
  uint64_t last_cpu_total_{};
  bool have_last_{false};
};

} // namespace puls::collectors
