#include "collectors/ThermalCollector.hpp"
#include "util/Procfs.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace puls::collectors {

// Read from hwmon first; fallback to thermal_zone
bool ThermalCollector::sample(puls::model::Thermal& out) {
  out = {};
  std::error_code ec;
  // hwmon: /sys/class/hwmon/hwmon*/temp*_input (millidegrees C)
  fs::path hw(puls::util::map_sys_path("/sys/class/hwmon"));
  double min_warn_c = 0.0; bool have_any_warn = false;
  for (fs::directory_iterator chip(hw, ec), end; !ec && chip != end; chip.increment(ec)) {
    // GPU hwmon chips are reported by the GPU source
    auto name = puls::util::read_file_string(chip->path().string() + "/name");
    if (name) {
      auto n = puls::util::trim(*name);
      if (n == "amdgpu" || n == "nouveau" || n == "i915" || n == "xe") continue;
    }
    std::error_code ec2;
    for (fs::directory_iterator f(chip->path(), ec2), fend; !ec2 && f != fend; f.increment(ec2)) {
      auto fname = f->path().filename().string();
      if (!fname.starts_with("temp") || !fname.ends_with("_input")) continue;
      auto mdeg = puls::util::read_file_int(f->path().string());
      if (!mdeg) continue;
      double c = static_cast<double>(*mdeg) / 1000.0;
      if (!out.has_temp || c > out.cpu_max_c) { out.has_temp = true; out.cpu_max_c = c; }
      auto base = fname.substr(0, fname.size() - 6);
      for (const char* suff : {"_crit", "_max", "_emergency"}) {
        auto thr = puls::util::read_file_int((chip->path() / (base + suff)).string());
        if (!thr) continue;
        double tc = static_cast<double>(*thr) / 1000.0;
        if (!have_any_warn || tc < min_warn_c) { min_warn_c = tc; have_any_warn = true; }
        break;
      }
    }
  }
  if (have_any_warn) { out.has_warn = true; out.warn_c = min_warn_c; }
  if (!out.has_temp) {
    fs::path tz(puls::util::map_sys_path("/sys/class/thermal"));
    ec.clear();
    for (fs::directory_iterator z(tz, ec), end; !ec && z != end; z.increment(ec)) {
      if (!z->path().filename().string().starts_with("thermal_zone")) continue;
      auto mdeg = puls::util::read_file_int((z->path() / "temp").string());
      if (!mdeg) continue;
      double c = static_cast<double>(*mdeg) / 1000.0;
      if (!out.has_temp || c > out.cpu_max_c) { out.has_temp = true; out.cpu_max_c = c; }
    }
  }
  return out.has_temp;
}

} // namespace puls::collectors
