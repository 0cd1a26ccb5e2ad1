#include "collectors/HostInfoCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/utsname.h>
#include <cstdlib>
#include <sstream>
#include <string>

namespace puls::collectors {

static std::string os_pretty_name() {
  for (const char* p : {"/etc/os-release", "/usr/lib/os-release"}) {
    auto txt = puls::util::read_file_string(p);
    if (!txt) continue;
    std::istringstream ss(*txt); std::string line;
    while (std::getline(ss, line)) {
      if (!line.starts_with("PRETTY_NAME=")) continue;
      std::string v = line.substr(12);
      if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        v = v.substr(1, v.size() - 2);
      return v;
    }
  }
  return "Linux";
}

static puls::model::HostInfo read_static_info() {
  puls::model::HostInfo info;
  if (auto h = puls::util::read_file_string("/proc/sys/kernel/hostname")) info.hostname = std::string(puls::util::trim(*h));
  if (auto k = puls::util::read_file_string("/proc/sys/kernel/osrelease")) info.kernel = std::string(puls::util::trim(*k));
  if (info.hostname.empty() || info.kernel.empty()) {
    struct utsname u{};
    if (::uname(&u) == 0) {
      if (info.hostname.empty()) info.hostname = u.nodename;
      if (info.kernel.empty()) info.kernel = u.release;
    }
  }
  info.os_name = os_pretty_name();
  if (auto st = puls::util::read_file_string("/proc/stat")) {
    std::istringstream ss(*st); std::string line;
    while (std::getline(ss, line)) {
      if (line.starts_with("cpu") && line.size() > 3 && line[3] >= '0' && line[3] <= '9') info.cpu_count++;
      if (line.starts_with("btime ")) info.boot_time = std::strtoll(line.c_str() + 6, nullptr, 10);
    }
  }
  return info;
}

bool HostInfoCollector::sample(puls::model::HostSnapshot& out) {
  if (!have_info_) { info_ = read_static_info(); have_info_ = true; }
  out.info = info_;
  if (out.info.cpu_model.empty()) out.info.cpu_model = out.cpu.model;

  out.has_loadavg = false;
  if (auto la = puls::util::read_file_string("/proc/loadavg")) {
    std::istringstream ls(*la);
    if (ls >> out.loadavg.one >> out.loadavg.five >> out.loadavg.fifteen) out.has_loadavg = true;
  }
  auto up = puls::util::read_file_string("/proc/uptime");
  if (!up) return out.has_loadavg;
  out.uptime_s = static_cast<uint64_t>(std::strtod(up->c_str(), nullptr));
  return true;
}

} // namespace puls::collectors
