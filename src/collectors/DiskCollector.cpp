#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace puls::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

static bool is_virtual_dev(const std::string& name) {
  return name.starts_with("loop") || name.starts_with("ram") || name.starts_with("zram") || name.starts_with("dm-");
}

bool DiskCollector::sample(puls::model::DiskSnapshot& out) {
  auto txt_opt = puls::util::read_file_string("/proc/diskstats");
  if (!txt_opt) return false;
  out.devices.clear(); out.total_read_bps = out.total_write_bps = 0.0;
  std::istringstream ss(*txt_opt); std::string line; double ts = now_secs();
  std::unordered_map<std::string, Prev> next;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major=0, minor=0; std::string name;
    uint64_t rd=0, rdmerge=0, rdsec=0, rdtm=0, wr=0, wrmerge=0, wrsec=0, wrtm=0, inprog=0, tios=0;
    if (!(ls>>major>>minor>>name>>rd>>rdmerge>>rdsec>>rdtm>>wr>>wrmerge>>wrsec>>wrtm>>inprog>>tios)) continue;
    if (is_virtual_dev(name)) continue;
    puls::model::DiskDev d; d.name=name; d.reads_completed=rd; d.writes_completed=wr; d.sectors_read=rdsec; d.sectors_written=wrsec; d.time_in_io_ms=tios;
    auto it = last_.find(name);
    if (it != last_.end()) {
      const auto& p = it->second; double dt = ts - p.ts; if (dt<=0.0) dt=1.0;
      // counters can reset when a device is re-attached
      uint64_t drd = rdsec >= p.rdsec ? rdsec - p.rdsec : 0;
      uint64_t dwr = wrsec >= p.wrsec ? wrsec - p.wrsec : 0;
      uint64_t dio = tios >= p.tios ? tios - p.tios : 0;
      d.read_bps = static_cast<double>(drd * kSectorSize) / dt;
      d.write_bps = static_cast<double>(dwr * kSectorSize) / dt;
      d.util_pct = std::min(100.0, (static_cast<double>(dio) / (dt * 1000.0)) * 100.0);
      out.total_read_bps += d.read_bps; out.total_write_bps += d.write_bps;
    }
    next[name] = Prev{rdsec, wrsec, tios, ts};
    out.devices.push_back(std::move(d));
  }
  last_ = std::move(next);
  return true;
}

} // namespace puls::collectors
