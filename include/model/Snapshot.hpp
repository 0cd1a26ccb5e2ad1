#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "model/Host.hpp"
#include "model/Net.hpp"
#include "model/Disk.hpp"
#include "model/Gpu.hpp"
#include "model/Container.hpp"
#include "model/Process.hpp"

namespace puls::model {

enum class SourceKind { Host, Disk, Net, Process, Gpu, Container };
inline constexpr size_t kSourceKindCount = 6;

const char* to_string(SourceKind k);

// Outcome of one poll of one source.
enum class SourceStatus { Ok, TimedOut, Unavailable, Error };

const char* to_string(SourceStatus s);

// What the published fragment for a source represents.
enum class SourceState {
  Live,          // polled successfully this tick
  Stale,         // this tick missed; last good value retained
  NotAvailable,  // no value: never populated or stale budget exhausted
  Disabled       // skipped by configuration or capability
};

const char* to_string(SourceState s);

struct SourceHealth {
  SourceState  state{SourceState::NotAvailable};
  SourceStatus last_status{SourceStatus::Unavailable};
  int          consecutive_misses{0};
  std::string  detail;  // reason for the last non-Ok outcome
};

// One fully assembled tick. Published immutably; readers never see a
// partially written snapshot. A nullopt fragment is N/A.
struct Snapshot {
  uint64_t seq{};
  std::chrono::system_clock::time_point taken_at{};

  std::optional<HostSnapshot>    host;
  std::optional<DiskSnapshot>    disk;
  std::optional<NetSnapshot>     net;
  std::optional<ProcessSnapshot> procs;
  std::optional<GpuList>         gpus;
  std::optional<ContainerList>   containers;

  // procs filtered and sorted with the active ProcessView
  std::vector<ProcSample> process_table;

  std::array<SourceHealth, kSourceKindCount> health{};

  // metric stream name -> samples, oldest first
  std::map<std::string, std::vector<double>> history;

  const SourceHealth& health_of(SourceKind k) const { return health[static_cast<size_t>(k)]; }
};

} // namespace puls::model
