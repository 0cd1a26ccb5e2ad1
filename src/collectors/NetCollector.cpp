#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace puls::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

bool NetCollector::is_virtual(const std::string& name) {
  static constexpr std::string_view kPrefixes[] = {
    "veth", "docker", "br-", "virbr", "cni", "flannel", "vnet", "podman"
  };
  for (auto p : kPrefixes)
    if (name.starts_with(p)) return true;
  return name == "lo";
}

static std::string sys_attr(const std::string& ifname, const char* attr) {
  auto v = puls::util::read_file_string("/sys/class/net/" + ifname + "/" + attr);
  return v ? std::string(puls::util::trim(*v)) : std::string();
}

// ARPHRD type 1 is ether; a wireless/ directory tells Wi-Fi apart.
static std::string iface_kind(const std::string& ifname) {
  std::string type = sys_attr(ifname, "type");
  if (type == "772") return "loopback";
  if (type != "1") return type.empty() ? "ethernet" : "other";
  if (puls::util::read_file_string("/sys/class/net/" + ifname + "/wireless/index") ||
      ifname.starts_with("wl")) return "wireless";
  return "ethernet";
}

static bool iface_up(const std::string& ifname) {
  std::string st = sys_attr(ifname, "operstate");
  if (st.empty()) return true; // no sysfs: assume up
  if (st == "up") return true;
  return st == "unknown" && sys_attr(ifname, "carrier") == "1";
}

bool NetCollector::sample(puls::model::NetSnapshot& out) {
  auto txt = puls::util::read_file_string("/proc/net/dev");
  if (!txt) return false;
  puls::model::NetSnapshot snap;
  std::map<std::string, Counters> seen;
  const double ts = now_secs();
  std::istringstream ss(*txt);
  std::string line;
  int line_no = 0;
  while (std::getline(ss, line)) {
    if (++line_no <= 2) continue; // two header lines
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    std::string name(puls::util::trim(std::string_view(line).substr(0, colon)));
    if (is_virtual(name)) continue;

    // rx: bytes packets errs drop fifo frame compressed multicast, then tx
    uint64_t f[16] = {};
    std::istringstream ns(line.substr(colon + 1));
    int got = 0;
    while (got < 16 && ns >> f[got]) ++got;
    if (got < 11) continue;

    puls::model::NetInterface ni;
    ni.name = name;
    ni.rx_total = f[0];  ni.rx_packets = f[1];  ni.rx_errors = f[2];
    ni.tx_total = f[8];  ni.tx_packets = f[9];  ni.tx_errors = f[10];
    ni.kind = iface_kind(name);
    ni.up = iface_up(name);

    if (auto it = prev_.find(name); it != prev_.end()) {
      double dt = ts - it->second.ts;
      if (dt <= 0.0) dt = 1.0;
      // a counter that went backwards means the interface was re-created
      if (ni.rx_total >= it->second.rx) ni.rx_bps = static_cast<double>(ni.rx_total - it->second.rx) / dt;
      if (ni.tx_total >= it->second.tx) ni.tx_bps = static_cast<double>(ni.tx_total - it->second.tx) / dt;
    }
    seen[name] = Counters{ni.rx_total, ni.tx_total, ts};
    snap.agg_rx_bps += ni.rx_bps;
    snap.agg_tx_bps += ni.tx_bps;
    snap.interfaces.push_back(std::move(ni));
  }
  prev_ = std::move(seen);
  out = std::move(snap);
  return true;
}

} // namespace puls::collectors
