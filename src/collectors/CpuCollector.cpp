#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <string>
#include <string_view>

namespace puls::collectors {

static void parse_cpu_line(std::string_view line, puls::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  auto pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static std::string read_cpu_model() {
  auto txt = puls::util::read_file_string("/proc/cpuinfo");
  if (!txt) return {};
  std::string_view all(*txt);
  size_t start = 0;
  while (start < all.size()) {
    size_t end = all.find('\n', start);
    if (end == std::string_view::npos) end = all.size();
    auto line = all.substr(start, end - start);
    start = end + 1;
    // x86 uses "model name"; arm kernels use "Hardware" or "Processor"
    if (line.starts_with("model name") || line.starts_with("Hardware") || line.starts_with("Processor")) {
      auto colon = line.find(':');
      if (colon != std::string_view::npos) return std::string(puls::util::trim(line.substr(colon + 1)));
    }
  }
  return {};
}

bool CpuCollector::sample(puls::model::CpuSnapshot& out) {
  if (cpu_model_.empty()) cpu_model_ = read_cpu_model();
  auto txt_opt = puls::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  puls::model::CpuTimes agg{}; std::vector<puls::model::CpuTimes> per;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); after_cpu = true; }
    else if (after_cpu && line.starts_with("cpu")) { puls::model::CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (after_cpu) break;
    start = end + 1;
  }
  if (!after_cpu) return false;

  double usage = 0.0; std::vector<double> per_pct(per.size(), 0.0);
  // counters only go backwards across a CPU hotplug or a checkpoint restore
  if (has_last_ && agg.total() < last_total_.total()) has_last_ = false;
  if (has_last_) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work()  - last_total_.work();
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
    for (size_t i = 0; i < per.size() && i < last_per_.size(); ++i) {
      if (per[i].total() < last_per_[i].total()) continue;
      auto tdi = per[i].total() - last_per_[i].total();
      auto wdi = per[i].work()  - last_per_[i].work();
      per_pct[i] = (tdi > 0) ? (100.0 * static_cast<double>(wdi) / static_cast<double>(tdi)) : 0.0;
    }
  }
  last_total_ = agg; last_per_ = per; has_last_ = true;
  out.total_times = agg; out.per_core = std::move(per); out.usage_pct = usage; out.per_core_pct = std::move(per_pct);
  out.model = cpu_model_;
  out.logical_threads = static_cast<int>(out.per_core_pct.size());
  if (out.logical_threads <= 0) out.logical_threads = 1;
  return true;
}

} // namespace puls::collectors
