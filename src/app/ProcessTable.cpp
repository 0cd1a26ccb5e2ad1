#include "app/ProcessTable.hpp"
#include "collectors/ProcessCollector.hpp"
#include <algorithm>
#include <cctype>

namespace puls::app {

const char* to_string(SortKey k) {
  switch (k) {
    case SortKey::Cpu: return "cpu";
    case SortKey::Memory: return "mem";
    case SortKey::Name: return "name";
    case SortKey::Pid: return "pid";
    case SortKey::General: return "general";
    case SortKey::DiskIo: return "io";
  }
  return "cpu";
}

SortKey parse_sort_key(const std::string& s) {
  if (s == "mem" || s == "memory") return SortKey::Memory;
  if (s == "name") return SortKey::Name;
  if (s == "pid") return SortKey::Pid;
  if (s == "general") return SortKey::General;
  if (s == "io" || s == "disk") return SortKey::DiskIo;
  return SortKey::Cpu;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

double general_score(const puls::model::ProcSample& p, unsigned cpu_count, const ProcessView& view) {
  double ncpu = cpu_count ? static_cast<double>(cpu_count) : 1.0;
  double cpu = std::clamp(p.cpu_pct / ncpu, 0.0, 100.0);
  double mem = std::clamp(p.mem_pct, 0.0, 100.0);
  return view.cpu_weight * cpu + view.mem_weight * mem;
}

static double io_rate(const puls::model::ProcSample& p) {
  return p.has_io ? p.io_read_bps + p.io_write_bps : 0.0;
}

std::vector<puls::model::ProcSample> build_process_table(const puls::model::ProcessSnapshot& ps,
                                                         const ProcessView& view) {
  std::vector<puls::model::ProcSample> rows;
  rows.reserve(ps.processes.size());
  const std::string needle = lower(view.filter);
  for (const auto& p : ps.processes) {
    if (!view.show_system && puls::collectors::ProcessCollector::is_system_process(p.name)) continue;
    if (!needle.empty()) {
      if (lower(p.name).find(needle) == std::string::npos &&
          lower(p.cmd).find(needle) == std::string::npos) continue;
    }
    rows.push_back(p);
  }

  // primary comparison: <0 if a sorts before b in ascending order
  auto cmp = [&](const puls::model::ProcSample& a, const puls::model::ProcSample& b) -> int {
    auto three = [](double x, double y) { return x < y ? -1 : (x > y ? 1 : 0); };
    switch (view.sort) {
      case SortKey::Cpu:     return three(a.cpu_pct, b.cpu_pct);
      case SortKey::Memory:  return three(static_cast<double>(a.rss_kb), static_cast<double>(b.rss_kb));
      case SortKey::Name:    return lower(a.name).compare(lower(b.name));
      case SortKey::Pid:     return three(a.pid, b.pid);
      case SortKey::General: return three(general_score(a, ps.cpu_count, view), general_score(b, ps.cpu_count, view));
      case SortKey::DiskIo:  return three(io_rate(a), io_rate(b));
    }
    return 0;
  };
  std::stable_sort(rows.begin(), rows.end(), [&](const auto& a, const auto& b) {
    int c = cmp(a, b);
    if (c != 0) return view.ascending ? c < 0 : c > 0;
    return a.pid < b.pid;
  });
  return rows;
}

} // namespace puls::app
