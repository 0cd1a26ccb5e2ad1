#include "collectors/ContainerCollector.hpp"
#include "util/UnixHttp.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <unordered_set>

using puls::model::ContainerEntry;
using puls::model::ContainerHealth;
using puls::model::SourceStatus;

namespace puls::collectors {

static double now_secs() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

static bool parse_json(const std::string& body, Json::Value& root, std::string& err) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(body.data(), body.data() + body.size(), &root, &err);
}

static uint64_t u64(const Json::Value& v) {
  if (v.isUInt64()) return v.asUInt64();
  if (v.isIntegral() && v.asInt64() > 0) return static_cast<uint64_t>(v.asInt64());
  if (v.isDouble() && v.asDouble() > 0) return static_cast<uint64_t>(v.asDouble());
  return 0;
}

static std::string str(const Json::Value& v) {
  return v.isString() ? v.asString() : std::string();
}

static ContainerHealth health_from(const Json::Value& c, const std::string& status) {
  std::string h;
  const auto& hv = c["Health"];
  if (hv.isObject()) h = str(hv["Status"]);
  if (h.empty()) {
    // older API versions only carry health in the status text
    if (status.find("(unhealthy)") != std::string::npos) h = "unhealthy";
    else if (status.find("(healthy)") != std::string::npos) h = "healthy";
    else if (status.find("health: starting") != std::string::npos) h = "starting";
  }
  if (h == "healthy") return ContainerHealth::Healthy;
  if (h == "unhealthy") return ContainerHealth::Unhealthy;
  if (h == "starting") return ContainerHealth::Starting;
  return ContainerHealth::None;
}

static std::string format_ports(const Json::Value& ports) {
  std::string out;
  std::unordered_set<std::string> seen; // IPv4 and IPv6 bindings repeat
  if (ports.isArray()) {
    for (const auto& p : ports) {
      uint64_t priv = u64(p["PrivatePort"]);
      uint64_t pub = u64(p["PublicPort"]);
      std::string s = pub ? std::to_string(pub) + ":" + std::to_string(priv) : std::to_string(priv);
      if (!seen.insert(s).second) continue;
      if (!out.empty()) out += ", ";
      out += s;
    }
  }
  return out.empty() ? "none" : out;
}

ContainerCollector::ContainerCollector(ContainerOptions opts) : opts_(std::move(opts)) {}

std::vector<std::string> ContainerCollector::socket_candidates() const {
  if (!opts_.socket_path.empty()) return {opts_.socket_path};
  std::vector<std::string> out;
  if (const char* dh = std::getenv("DOCKER_HOST"); dh && std::string_view(dh).starts_with("unix://"))
    out.emplace_back(dh + 7);
  out.emplace_back("/var/run/docker.sock");
  out.emplace_back("/run/podman/podman.sock");
  if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg)
    out.emplace_back(std::string(xdg) + "/podman/podman.sock");
  return out;
}

bool ContainerCollector::parse_list(const std::string& body, puls::model::ContainerList& out,
                                    std::vector<std::string>& full_ids, std::string& err) {
  Json::Value root;
  if (!parse_json(body, root, err)) return false;
  if (!root.isArray()) { err = "container list is not an array"; return false; }
  for (const auto& c : root) {
    if (!c.isObject()) continue;
    ContainerEntry e;
    std::string id = str(c["Id"]);
    if (id.empty()) continue;
    e.id = id.substr(0, 12);
    const auto& names = c["Names"];
    if (names.isArray() && !names.empty()) {
      e.name = str(names[0]);
      if (!e.name.empty() && e.name.front() == '/') e.name.erase(0, 1);
    }
    if (e.name.empty()) e.name = "unnamed";
    e.image = str(c["Image"]);
    e.state = str(c["State"]);
    e.status = str(c["Status"]);
    e.health = health_from(c, e.status);
    e.ports = format_ports(c["Ports"]);
    out.push_back(std::move(e));
    full_ids.push_back(std::move(id));
  }
  return true;
}

void ContainerCollector::apply_stats(const std::string& full_id, const Json::Value& s, ContainerEntry& e,
                                     std::unordered_map<std::string, Prev>& next, double ts) {
  Prev cur;
  cur.ts = ts;
  cur.cpu_total = u64(s["cpu_stats"]["cpu_usage"]["total_usage"]);
  cur.system_total = u64(s["cpu_stats"]["system_cpu_usage"]);
  uint64_t ncpu = u64(s["cpu_stats"]["online_cpus"]);
  if (ncpu == 0 && s["cpu_stats"]["cpu_usage"]["percpu_usage"].isArray())
    ncpu = s["cpu_stats"]["cpu_usage"]["percpu_usage"].size();
  if (ncpu == 0) ncpu = 1;

  const auto& nets = s["networks"];
  if (nets.isObject()) {
    for (const auto& name : nets.getMemberNames()) {
      cur.rx += u64(nets[name]["rx_bytes"]);
      cur.tx += u64(nets[name]["tx_bytes"]);
    }
  }
  const auto& blk = s["blkio_stats"]["io_service_bytes_recursive"];
  if (blk.isArray()) {
    for (const auto& entry : blk) {
      auto op = str(entry["op"]);
      if (op == "Read" || op == "read") cur.rd += u64(entry["value"]);
      else if (op == "Write" || op == "write") cur.wr += u64(entry["value"]);
    }
  }

  // engine-supplied previous sample wins; one-shot responses leave it empty
  uint64_t pre_cpu = u64(s["precpu_stats"]["cpu_usage"]["total_usage"]);
  uint64_t pre_sys = u64(s["precpu_stats"]["system_cpu_usage"]);
  auto it = prev_.find(full_id);
  if (pre_sys == 0 && it != prev_.end()) { pre_cpu = it->second.cpu_total; pre_sys = it->second.system_total; }
  if (pre_sys > 0 && cur.system_total > pre_sys && cur.cpu_total > pre_cpu) {
    e.cpu_pct = static_cast<double>(cur.cpu_total - pre_cpu) / static_cast<double>(cur.system_total - pre_sys)
                * static_cast<double>(ncpu) * 100.0;
  }

  const auto& mem = s["memory_stats"];
  uint64_t usage = u64(mem["usage"]);
  uint64_t inactive = u64(mem["stats"]["inactive_file"]);
  if (inactive == 0) inactive = u64(mem["stats"]["total_inactive_file"]);
  e.mem_used_bytes = usage > inactive ? usage - inactive : usage;
  e.mem_limit_bytes = u64(mem["limit"]);

  if (it != prev_.end()) {
    const auto& p = it->second;
    double dt = ts - p.ts; if (dt <= 0.0) dt = 1.0;
    auto rate = [dt](uint64_t now, uint64_t before) {
      return now >= before ? static_cast<double>(now - before) / dt : 0.0;
    };
    e.net_rx_bps = rate(cur.rx, p.rx);
    e.net_tx_bps = rate(cur.tx, p.tx);
    e.blk_read_bps = rate(cur.rd, p.rd);
    e.blk_write_bps = rate(cur.wr, p.wr);
  }
  e.has_stats = true;
  next[full_id] = cur;
}

SourceStatus ContainerCollector::poll(puls::model::ContainerList& out, std::string& detail) {
  out.clear();
  std::string socket;
  std::error_code ec;
  for (const auto& cand : socket_candidates()) {
    if (std::filesystem::exists(cand, ec)) { socket = cand; break; }
  }
  if (socket.empty()) { detail = "no container engine socket"; return SourceStatus::Unavailable; }

  puls::util::UnixHttpClient client(socket, opts_.timeout_ms);
  puls::util::HttpError herr{};
  auto resp = client.get("/containers/json?all=1", herr);
  if (!resp) {
    detail = socket + ": " + puls::util::to_string(herr);
    switch (herr) {
      case puls::util::HttpError::Timeout: return SourceStatus::TimedOut;
      case puls::util::HttpError::Protocol: return SourceStatus::Error;
      default: return SourceStatus::Unavailable; // daemon absent or socket not ours
    }
  }
  if (resp->status != 200) {
    detail = "engine returned HTTP " + std::to_string(resp->status);
    return SourceStatus::Error;
  }
  std::vector<std::string> ids;
  std::string err;
  bool parsed = false;
  try {
    parsed = parse_list(resp->body, out, ids, err);
  } catch (const Json::Exception& ex) {
    err = ex.what(); // field of an unexpected type
  }
  if (!parsed) {
    detail = "container list: " + err;
    out.clear();
    return SourceStatus::Error;
  }

  std::unordered_map<std::string, Prev> next;
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i].state != "running") continue;
    auto sresp = client.get("/containers/" + ids[i] + "/stats?stream=false&one-shot=true", herr);
    if (!sresp || sresp->status != 200) continue; // stats for one container are best effort
    Json::Value stats;
    std::string serr;
    if (!parse_json(sresp->body, stats, serr) || !stats.isObject()) continue;
    try {
      apply_stats(ids[i], stats, out[i], next, now_secs());
    } catch (const Json::Exception& ex) {
      out[i].has_stats = false;
      std::fprintf(stderr, "puls: containers: stats for %s: %s\n", out[i].id.c_str(), ex.what());
    }
  }
  prev_ = std::move(next);
  return SourceStatus::Ok;
}

} // namespace puls::collectors
