#pragma once
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace puls::app {

enum class SortKey { Cpu, Memory, Name, Pid, General, DiskIo };

const char* to_string(SortKey k);
// Accepts cpu, mem|memory, name, pid, general, io|disk; falls back to Cpu.
SortKey parse_sort_key(const std::string& s);

// How the process list is presented. Reapplied to the fresh sample list
// every tick.
struct ProcessView {
  SortKey sort{SortKey::Cpu};
  bool ascending{false};
  std::string filter;       // case-insensitive substring on name or command
  bool show_system{false};
  double cpu_weight{0.6};   // "General" score weights
  double mem_weight{0.4};
};

// Weighted score of normalized CPU (share of the whole machine) and memory.
double general_score(const puls::model::ProcSample& p, unsigned cpu_count, const ProcessView& view);

// Filters then sorts. Ties always break on ascending pid.
std::vector<puls::model::ProcSample> build_process_table(const puls::model::ProcessSnapshot& ps,
                                                         const ProcessView& view);

} // namespace puls::app
