#include "control/ServiceManager.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <string_view>

namespace puls::control {

const char* to_string(ServiceVerb v) {
  switch (v) {
    case ServiceVerb::Start: return "start";
    case ServiceVerb::Stop: return "stop";
    case ServiceVerb::Restart: return "restart";
    case ServiceVerb::Enable: return "enable";
    case ServiceVerb::Disable: return "disable";
  }
  return "start";
}

bool needs_confirmation(ServiceVerb v) {
  return v == ServiceVerb::Stop || v == ServiceVerb::Restart || v == ServiceVerb::Disable;
}

bool ServiceManager::valid_unit_name(const std::string& unit) {
  if (unit.empty() || unit.size() > 255) return false;
  if (unit.front() == '-' || unit.front() == '.') return false;
  for (char c : unit) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) continue;
    if (c == '-' || c == '_' || c == '.' || c == '@' || c == ':' || c == '\\') continue;
    return false;
  }
  return true;
}

std::string ServiceManager::normalize(const std::string& unit) {
  static const char* suffixes[] = {".service", ".socket", ".timer", ".target", ".mount", ".path"};
  for (const char* s : suffixes) {
    std::string_view sv(s);
    if (unit.size() > sv.size() && std::string_view(unit).substr(unit.size() - sv.size()) == sv) return unit;
  }
  return unit + ".service";
}

// --plain drops the status bullet, but older systemd still prints it for
// failed units
static std::vector<std::string> split_ws(const std::string& line, size_t max_fields, std::string* rest) {
  std::vector<std::string> f;
  std::istringstream is(line);
  std::string tok;
  while (f.size() < max_fields && is >> tok) {
    if (f.empty() && (tok == "\xe2\x97\x8f" || tok == "*")) continue;
    f.push_back(tok);
  }
  if (rest) {
    std::getline(is, *rest);
    size_t b = rest->find_first_not_of(" \t");
    *rest = (b == std::string::npos) ? std::string() : rest->substr(b);
  }
  return f;
}

void ServiceManager::parse_list_units(const std::string& text, std::vector<puls::model::ServiceUnit>& out) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::string desc;
    auto f = split_ws(line, 4, &desc);
    if (f.size() < 4) continue;
    if (f[0].find(".service") == std::string::npos) continue;
    puls::model::ServiceUnit u;
    u.name = f[0];
    u.load_state = f[1];
    u.active_state = f[2];
    u.sub_state = f[3];
    u.description = desc;
    out.push_back(std::move(u));
  }
}

void ServiceManager::parse_unit_files(const std::string& text, std::vector<puls::model::ServiceUnit>& out) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    auto f = split_ws(line, 2, nullptr);
    if (f.size() < 2) continue;
    if (f[0].find(".service") == std::string::npos) continue;
    puls::model::ServiceUnit u;
    u.name = f[0];
    u.enabled_state = f[1];
    out.push_back(std::move(u));
  }
}

ActionOutcome ServiceManager::list(std::vector<puls::model::ServiceUnit>& out) {
  out.clear();
  auto units = runner_.run({"systemctl", "list-units", "--type=service", "--all",
                            "--no-pager", "--no-legend", "--plain"});
  if (!units.spawned) return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, "systemctl not available", units.exit_code);
  if (units.exit_code != 0) return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, units.output, units.exit_code);
  auto files = runner_.run({"systemctl", "list-unit-files", "--type=service",
                            "--no-pager", "--no-legend"});
  if (!files.spawned || files.exit_code != 0)
    return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, files.output, files.exit_code);

  std::vector<puls::model::ServiceUnit> loaded, installed;
  parse_list_units(units.output, loaded);
  parse_unit_files(files.output, installed);

  std::map<std::string, puls::model::ServiceUnit> merged;
  for (auto& u : loaded) merged[u.name] = std::move(u);
  for (auto& f : installed) {
    // templates (foo@.service) cannot be started without an instance
    if (f.name.find("@.") != std::string::npos) continue;
    auto it = merged.find(f.name);
    if (it != merged.end()) {
      it->second.enabled_state = f.enabled_state;
      continue;
    }
    // installed but never loaded: stopped
    f.load_state = "not-loaded";
    f.active_state = "inactive";
    f.sub_state = "dead";
    merged.emplace(f.name, std::move(f));
  }
  out.reserve(merged.size());
  for (auto& [name, u] : merged) out.push_back(std::move(u));
  return ActionOutcome::success();
}

ActionOutcome ServiceManager::apply(ServiceVerb verb, const std::string& unit) {
  if (!valid_unit_name(unit))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid unit name: " + unit);
  std::string name = normalize(unit);
  auto res = runner_.run({"systemctl", to_string(verb), name});
  if (!res.spawned)
    return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, "systemctl not available", res.exit_code);
  if (res.exit_code != 0)
    return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, res.output, res.exit_code);
  return ActionOutcome::success(std::string(to_string(verb)) + " " + name);
}

} // namespace puls::control
