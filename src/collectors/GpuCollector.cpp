#include "collectors/GpuCollector.hpp"
#include "util/NvmlDyn.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;
using puls::model::GpuDevice;
using puls::model::GpuList;
using puls::model::GpuVendor;
using puls::model::SourceStatus;

namespace puls::collectors {

namespace {

struct DrmCard {
  int num{};
  fs::path card;   // /sys/class/drm/cardN
  fs::path dev;    // /sys/class/drm/cardN/device
};

// cardN entries (connectors like card0-DP-1 are skipped) whose PCI vendor matches
std::vector<DrmCard> drm_cards(std::string_view vendor_id) {
  std::vector<DrmCard> out;
  std::error_code ec;
  fs::path drm(puls::util::map_sys_path("/sys/class/drm"));
  for (fs::directory_iterator it(drm, ec), end; !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    if (!name.starts_with("card") || name.size() == 4) continue;
    if (!std::all_of(name.begin() + 4, name.end(), [](char c){ return c >= '0' && c <= '9'; })) continue;
    auto vendor = puls::util::read_file_string((it->path() / "device" / "vendor").string());
    if (!vendor || puls::util::trim(*vendor) != vendor_id) continue;
    out.push_back(DrmCard{std::atoi(name.c_str() + 4), it->path(), it->path() / "device"});
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.num < b.num; });
  return out;
}

std::optional<fs::path> first_hwmon(const fs::path& dev) {
  std::error_code ec;
  for (fs::directory_iterator it(dev / "hwmon", ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().filename().string().starts_with("hwmon")) return it->path();
  }
  return std::nullopt;
}

std::optional<long long> read_int(const fs::path& p) {
  return puls::util::read_file_int(p.string());
}

std::string pci_label(const fs::path& dev, const char* fallback) {
  if (auto pn = puls::util::read_file_string((dev / "product_name").string())) {
    auto t = puls::util::trim(*pn);
    if (!t.empty()) return std::string(t);
  }
  std::string label = fallback;
  if (auto ue = puls::util::read_file_string((dev / "uevent").string())) {
    std::istringstream ss(*ue); std::string line;
    while (std::getline(ss, line)) {
      if (line.starts_with("PCI_ID=")) { label += " (" + std::string(puls::util::trim(line.substr(7))) + ")"; break; }
    }
  }
  return label;
}

void read_hwmon_common(const fs::path& dev, GpuDevice& rec) {
  auto hw = first_hwmon(dev);
  if (!hw) return;
  if (auto t = read_int(*hw / "temp1_input")) { rec.has_temp = true; rec.temp_c = static_cast<double>(*t) / 1000.0; }
  for (const char* f : {"power1_average", "power1_input"}) {
    if (auto uw = read_int(*hw / f)) { rec.has_power = true; rec.power_w = static_cast<double>(*uw) / 1'000'000.0; break; }
  }
}

bool is_na(std::string_view v) {
  return v.empty() || v.front() == '[' || v == "N/A";
}

} // namespace

// --- NVIDIA ---

NvidiaGpuSource::NvidiaGpuSource(GpuOptions opts)
  : opts_(std::move(opts)), runner_(std::make_unique<puls::util::PopenCommandRunner>()) {}

bool NvidiaGpuSource::parse_smi_csv(const std::string& text, GpuList& out) {
  std::istringstream ss(text); std::string line;
  bool any = false;
  while (std::getline(ss, line)) {
    std::vector<std::string> f;
    std::string_view rest(line);
    while (true) {
      auto comma = rest.find(',');
      f.emplace_back(puls::util::trim(rest.substr(0, comma)));
      if (comma == std::string_view::npos) break;
      rest.remove_prefix(comma + 1);
    }
    if (f.size() < 8 || is_na(f[0])) continue;
    GpuDevice rec;
    rec.vendor = GpuVendor::Nvidia;
    rec.index = std::atoi(f[0].c_str());
    rec.name = is_na(f[1]) ? "NVIDIA GPU" : f[1];
    auto num = [](const std::string& s, bool& has, double& v) {
      if (is_na(s)) return;
      char* end = nullptr;
      double d = std::strtod(s.c_str(), &end);
      if (end == s.c_str()) return;
      has = true; v = d;
    };
    num(f[2], rec.has_util, rec.util_pct);
    bool has_used = false, has_total = false; double used = 0, total = 0;
    num(f[3], has_used, used);
    num(f[4], has_total, total);
    if (has_used && has_total && total > 0) {
      rec.has_vram = true;
      rec.vram_used_mb = static_cast<uint64_t>(used);
      rec.vram_total_mb = static_cast<uint64_t>(total);
    }
    num(f[5], rec.has_temp, rec.temp_c);
    num(f[6], rec.has_power, rec.power_w);
    num(f[7], rec.has_clock, rec.clock_mhz);
    out.push_back(std::move(rec));
    any = true;
  }
  return any;
}

bool NvidiaGpuSource::read_smi(GpuList& out, std::string& detail) {
  if (opts_.smi_path.empty()) return false;
  std::string path;
  if (opts_.smi_path == "auto") {
    // do not spawn a process every tick on machines without the driver
    std::error_code ec;
    if (!fs::exists(puls::util::map_proc_path("/proc/driver/nvidia"), ec)) return false;
    path = puls::util::find_executable("nvidia-smi");
    if (path.empty()) return false;
  } else {
    path = opts_.smi_path;
  }
  auto res = runner_->run({path,
      "--query-gpu=index,name,utilization.gpu,memory.used,memory.total,temperature.gpu,power.draw,clocks.gr",
      "--format=csv,noheader,nounits"});
  if (!res.spawned) return false;
  if (res.exit_code != 0) {
    detail = "nvidia-smi: " + std::string(puls::util::trim(res.output));
    return false;
  }
  return parse_smi_csv(res.output, out);
}

static bool read_nvidia_proc(GpuList& out) {
  std::error_code ec;
  fs::path root(puls::util::map_proc_path("/proc/driver/nvidia/gpus"));
  std::vector<fs::path> dirs;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) dirs.push_back(it->path());
  std::sort(dirs.begin(), dirs.end());
  int idx = 0;
  for (const auto& d : dirs) {
    GpuDevice rec;
    rec.vendor = GpuVendor::Nvidia;
    rec.index = idx++;
    rec.bus_id = d.filename().string();
    rec.name = "NVIDIA GPU";
    if (auto info = puls::util::read_file_string((d / "information").string())) {
      std::istringstream ss(*info); std::string line;
      while (std::getline(ss, line)) {
        if (line.starts_with("Model:")) { rec.name = std::string(puls::util::trim(line.substr(6))); break; }
      }
    }
    if (auto fb = puls::util::read_file_string((d / "fb_memory_usage").string())) {
      // "Total : 4096 MiB" / "Used : 1024 MiB"
      uint64_t total = 0, used = 0;
      std::istringstream ss(*fb); std::string line;
      while (std::getline(ss, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        uint64_t v = std::strtoull(line.c_str() + colon + 1, nullptr, 10);
        if (line.starts_with("Total")) total = v;
        else if (line.starts_with("Used")) used = v;
      }
      if (total > 0) { rec.has_vram = true; rec.vram_total_mb = total; rec.vram_used_mb = used; }
    }
    out.push_back(std::move(rec));
  }
  return !dirs.empty();
}

SourceStatus NvidiaGpuSource::poll(GpuList& out, std::string& detail) {
  auto& nvml = puls::util::NvmlDyn::instance();
  if (nvml.load_once(opts_.disable_nvml, opts_.nvml_path)) {
    GpuList devs;
    if (nvml.read_devices(devs) && !devs.empty()) {
      out.insert(out.end(), devs.begin(), devs.end());
      return SourceStatus::Ok;
    }
  }
  GpuList devs;
  if (read_smi(devs, detail)) { out.insert(out.end(), devs.begin(), devs.end()); return SourceStatus::Ok; }
  devs.clear();
  if (read_nvidia_proc(devs)) { out.insert(out.end(), devs.begin(), devs.end()); return SourceStatus::Ok; }
  // the driver is loaded but nothing could be read
  if (!detail.empty()) return SourceStatus::Error;
  detail = "no NVIDIA GPU";
  return SourceStatus::Unavailable;
}

// --- AMD ---

SourceStatus AmdGpuSource::poll(GpuList& out, std::string& detail) {
  auto cards = drm_cards("0x1002");
  if (cards.empty()) { detail = "no AMD GPU"; return SourceStatus::Unavailable; }
  int idx = 0;
  for (const auto& c : cards) {
    GpuDevice rec;
    rec.vendor = GpuVendor::Amd;
    rec.index = idx++;
    rec.bus_id = c.card.filename().string();
    rec.name = pci_label(c.dev, "AMD GPU");
    if (auto busy = read_int(c.dev / "gpu_busy_percent")) { rec.has_util = true; rec.util_pct = static_cast<double>(*busy); }
    auto tot = read_int(c.dev / "mem_info_vram_total");
    auto usd = read_int(c.dev / "mem_info_vram_used");
    if (tot && usd && *tot > 0) {
      rec.has_vram = true;
      rec.vram_total_mb = static_cast<uint64_t>(*tot) / (1024ull * 1024ull);
      rec.vram_used_mb = static_cast<uint64_t>(*usd) / (1024ull * 1024ull);
    }
    read_hwmon_common(c.dev, rec);
    if (auto hw = first_hwmon(c.dev)) {
      if (auto hz = read_int(*hw / "freq1_input")) { rec.has_clock = true; rec.clock_mhz = static_cast<double>(*hz) / 1e6; }
    }
    if (!rec.has_clock) {
      // active level is marked with '*', e.g. "1: 1800Mhz *"
      if (auto sclk = puls::util::read_file_string((c.dev / "pp_dpm_sclk").string())) {
        std::istringstream ss(*sclk); std::string line;
        while (std::getline(ss, line)) {
          if (line.find('*') == std::string::npos) continue;
          auto colon = line.find(':');
          if (colon == std::string::npos) break;
          rec.has_clock = true; rec.clock_mhz = std::strtod(line.c_str() + colon + 1, nullptr);
          break;
        }
      }
    }
    out.push_back(std::move(rec));
  }
  return SourceStatus::Ok;
}

// --- Intel ---

SourceStatus IntelGpuSource::poll(GpuList& out, std::string& detail) {
  auto cards = drm_cards("0x8086");
  if (cards.empty()) { detail = "no Intel GPU"; return SourceStatus::Unavailable; }
  int idx = 0;
  for (const auto& c : cards) {
    GpuDevice rec;
    rec.vendor = GpuVendor::Intel;
    rec.index = idx++;
    rec.bus_id = c.card.filename().string();
    rec.name = pci_label(c.dev, "Intel Graphics");
    for (const char* f : {"gt_act_freq_mhz", "gt_cur_freq_mhz"}) {
      if (auto mhz = read_int(c.card / f)) { rec.has_clock = true; rec.clock_mhz = static_cast<double>(*mhz); break; }
    }
    auto tot = read_int(c.dev / "mem_info_vram_total");
    auto usd = read_int(c.dev / "mem_info_vram_used");
    if (tot && usd && *tot > 0) {
      rec.has_vram = true;
      rec.vram_total_mb = static_cast<uint64_t>(*tot) / (1024ull * 1024ull);
      rec.vram_used_mb = static_cast<uint64_t>(*usd) / (1024ull * 1024ull);
    }
    read_hwmon_common(c.dev, rec);
    out.push_back(std::move(rec));
  }
  return SourceStatus::Ok;
}

// --- merged ---

GpuCollector::GpuCollector(GpuOptions opts) {
  backends_.emplace_back(std::in_place_type<NvidiaGpuSource>, std::move(opts));
  backends_.emplace_back(std::in_place_type<AmdGpuSource>);
  backends_.emplace_back(std::in_place_type<IntelGpuSource>);
}

SourceStatus GpuCollector::poll(GpuList& out, std::string& detail) {
  out.clear();
  bool any_ok = false;
  std::string error;
  for (auto& backend : backends_) {
    std::string d;
    auto st = std::visit([&](auto& b){ return b.poll(out, d); }, backend);
    if (st == SourceStatus::Ok) any_ok = true;
    else if (st == SourceStatus::Error && error.empty()) error = d;
  }
  if (any_ok) return SourceStatus::Ok;
  if (!error.empty()) { detail = error; return SourceStatus::Error; }
  detail = "no GPU detected";
  return SourceStatus::Unavailable;
}

bool GpuCollector::sample(GpuList& out) {
  std::string detail;
  return poll(out, detail) == SourceStatus::Ok;
}

} // namespace puls::collectors
