#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace puls::collectors {

static double now_secs() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

struct StatTotals { uint64_t cpu_total{}; unsigned ncpu{}; int64_t btime{}; };

static StatTotals read_stat_totals() {
  StatTotals t;
  auto txt = puls::util::read_file_string("/proc/stat"); if (!txt) return t;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.starts_with("cpu ")) {
      std::istringstream ls(line.substr(4));
      uint64_t v = 0;
      for (int i = 0; i < 8 && (ls >> v); ++i) t.cpu_total += v;
    } else if (line.starts_with("cpu") && line.size() > 3 && line[3] >= '0' && line[3] <= '9') {
      t.ncpu++;
    } else if (line.starts_with("btime ")) {
      t.btime = std::strtoll(line.c_str() + 6, nullptr, 10);
    }
  }
  if (t.ncpu == 0) t.ncpu = 1;
  return t;
}

static uint64_t read_mem_total_kb() {
  auto txt = puls::util::read_file_string("/proc/meminfo"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.starts_with("MemTotal:")) return std::strtoull(line.c_str() + 9, nullptr, 10);
  }
  return 0;
}

bool ProcessCollector::is_system_process(std::string_view name) {
  static constexpr std::string_view kPrefixes[] = {
    "kthreadd", "migration", "rcu_", "watchdog", "systemd", "kernel", "kworker",
    "ksoftirqd", "init", "swapper", "[", "dbus", "NetworkManager"
  };
  for (auto p : kPrefixes)
    if (name.starts_with(p)) return true;
  return false;
}

bool ProcessCollector::parse_stat(const std::string& content, StatFields& out) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  std::string skip;
  ss >> out.state >> out.ppid;
  // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i = 0; i < 9; i++) ss >> skip;
  ss >> out.utime >> out.stime;
  // cutime cstime priority nice
  for (int i = 0; i < 4; i++) ss >> skip;
  ss >> out.threads;
  ss >> skip; // itrealvalue
  ss >> out.starttime >> out.vsize >> out.rss_pages;
  return static_cast<bool>(ss);
}

std::string ProcessCollector::read_cmdline(int32_t pid) {
  auto bytes = puls::util::read_file_bytes("/proc/" + std::to_string(pid) + "/cmdline");
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

const std::string& ProcessCollector::user_name(uint32_t uid) {
  auto it = users_.find(uid);
  if (it != users_.end()) return it->second;
  std::string name = std::to_string(uid);
  std::ifstream pw("/etc/passwd"); std::string pl;
  while (std::getline(pw, pl)) {
    auto c1 = pl.find(':'); if (c1 == std::string::npos) continue;
    auto c2 = pl.find(':', c1 + 1); if (c2 == std::string::npos) continue;
    if (std::strtoul(pl.c_str() + c2 + 1, nullptr, 10) == uid) { name = pl.substr(0, c1); break; }
  }
  return users_.emplace(uid, std::move(name)).first->second;
}

bool ProcessCollector::read_status(int32_t pid, uint32_t& uid) {
  auto txt = puls::util::read_file_string("/proc/" + std::to_string(pid) + "/status");
  if (!txt) return false;
  auto pos = txt->find("\nUid:");
  if (pos == std::string::npos) return false;
  uid = static_cast<uint32_t>(std::strtoul(txt->c_str() + pos + 5, nullptr, 10));
  return true;
}

bool ProcessCollector::sample(puls::model::ProcessSnapshot& out) {
  auto totals = read_stat_totals();
  if (totals.cpu_total == 0) return false;
  uint64_t mem_total_kb = read_mem_total_kb();
  long hz = ::sysconf(_SC_CLK_TCK); if (hz <= 0) hz = 100;
  long page_kb = ::sysconf(_SC_PAGESIZE) / 1024; if (page_kb <= 0) page_kb = 4;
  double ts = now_secs();

  out = {};
  out.cpu_count = totals.ncpu;
  uint64_t dt = (have_last_ && totals.cpu_total > last_cpu_total_) ? totals.cpu_total - last_cpu_total_ : 0;

  std::unordered_map<int32_t, std::pair<uint64_t, uint64_t>> next_cpu;
  std::unordered_map<int32_t, IoPrev> next_io;
  for (const auto& entry : puls::util::list_dir("/proc")) {
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(entry.data(), entry.data() + entry.size(), pid);
    if (ec != std::errc() || ptr != entry.data() + entry.size()) continue;
    auto base = "/proc/" + entry;
    auto stat_txt = puls::util::read_file_string(base + "/stat");
    if (!stat_txt) continue; // exited during the scan
    StatFields sf;
    if (!parse_stat(*stat_txt, sf)) continue;

    puls::model::ProcSample ps;
    ps.pid = pid; ps.ppid = sf.ppid; ps.state = sf.state;
    ps.utime = sf.utime; ps.stime = sf.stime; ps.total_time = sf.utime + sf.stime;
    ps.rss_kb = sf.rss_pages > 0 ? static_cast<uint64_t>(sf.rss_pages) * static_cast<uint64_t>(page_kb) : 0;
    ps.mem_pct = mem_total_kb ? 100.0 * static_cast<double>(ps.rss_kb) / static_cast<double>(mem_total_kb) : 0.0;
    ps.threads = sf.threads;
    ps.start_time = totals.btime + static_cast<int64_t>(sf.starttime / static_cast<uint64_t>(hz));
    ps.name = sf.comm;

    // a reused pid has a different start time and gets no delta
    auto it = last_cpu_.find(pid);
    if (dt > 0 && it != last_cpu_.end() && it->second.first == sf.starttime && ps.total_time >= it->second.second) {
      double dp = static_cast<double>(ps.total_time - it->second.second);
      ps.cpu_pct = 100.0 * dp / static_cast<double>(dt) * static_cast<double>(totals.ncpu);
    }
    next_cpu[pid] = {sf.starttime, ps.total_time};

    if (auto io = puls::util::read_file_string(base + "/io")) {
      uint64_t rd = 0, wr = 0;
      std::istringstream is(*io); std::string line;
      while (std::getline(is, line)) {
        if (line.starts_with("read_bytes:")) rd = std::strtoull(line.c_str() + 11, nullptr, 10);
        else if (line.starts_with("write_bytes:")) wr = std::strtoull(line.c_str() + 12, nullptr, 10);
      }
      auto pit = last_io_.find(pid);
      if (pit != last_io_.end() && pit->second.starttime == sf.starttime) {
        double el = ts - pit->second.ts; if (el <= 0.0) el = 1.0;
        ps.has_io = true;
        ps.io_read_bps = rd >= pit->second.rd ? static_cast<double>(rd - pit->second.rd) / el : 0.0;
        ps.io_write_bps = wr >= pit->second.wr ? static_cast<double>(wr - pit->second.wr) / el : 0.0;
      } else {
        // first sighting: readable, no rate yet
        ps.has_io = true;
      }
      next_io[pid] = IoPrev{sf.starttime, rd, wr, ts};
    }

    ps.cmd = read_cmdline(pid);
    if (ps.cmd.empty()) ps.cmd = sf.comm; // kernel threads
    uint32_t uid = 0;
    if (read_status(pid, uid)) ps.user_name = user_name(uid);

    switch (sf.state) {
      case 'R': out.state_running++; break;
      case 'S': case 'D': out.state_sleeping++; break;
      case 'Z': out.state_zombie++; break;
      default: break;
    }
    out.total_threads += static_cast<size_t>(sf.threads > 0 ? sf.threads : 1);
    out.processes.push_back(std::move(ps));
  }
  out.total_processes = out.processes.size();
  last_cpu_ = std::move(next_cpu);
  last_io_ = std::move(next_io);
  last_cpu_total_ = totals.cpu_total; have_last_ = true;
  return true;
}

} // namespace puls::collectors
