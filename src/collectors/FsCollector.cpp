#include "collectors/FsCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>
#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>

namespace puls::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","efivarfs","binfmt_misc","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

// /proc/mounts escapes spaces and tabs as octal
static std::string unescape_mount(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size()) {
      int v = 0; bool ok = true;
      for (size_t j = 1; j <= 3; ++j) {
        char c = s[i + j];
        if (c < '0' || c > '7') { ok = false; break; }
        v = v * 8 + (c - '0');
      }
      if (ok) { out.push_back(static_cast<char>(v)); i += 3; continue; }
    }
    out.push_back(s[i]);
  }
  return out;
}

bool FsCollector::sample(std::vector<puls::model::FsMount>& out) {
  out.clear();
  auto txt = puls::util::read_file_string("/proc/self/mounts");
  if (!txt) return false;
  std::istringstream f(*txt);
  std::unordered_set<std::string> seen;
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype, opts;
    if (!(ls >> device >> mountpoint >> fstype >> opts)) continue;
    if (is_pseudo_fs(fstype)) continue;
    mountpoint = unescape_mount(mountpoint);
    if (!seen.insert(mountpoint).second) continue;

    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) continue;
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    if (total == 0) continue;
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    uint64_t used = (total > avail) ? (total - avail) : 0ULL;

    puls::model::FsMount m;
    m.device = device;
    m.mountpoint = mountpoint;
    m.fstype = fstype;
    m.total_bytes = total;
    m.avail_bytes = avail;
    m.used_bytes = used;
    m.used_pct = 100.0 * static_cast<double>(used) / static_cast<double>(total);
    out.push_back(std::move(m));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){
    if (a.used_pct != b.used_pct) return a.used_pct > b.used_pct;
    return a.used_bytes > b.used_bytes;
  });
  return true;
}

} // namespace puls::collectors
