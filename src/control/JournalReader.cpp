#include "control/JournalReader.hpp"
#include "control/ServiceManager.hpp"
#include <json/json.h>
#include <memory>
#include <sstream>

namespace puls::control {

static bool valid_boot(const std::string& b) {
  if (b.empty() || b.size() > 64) return false;
  size_t i = (b[0] == '-' || b[0] == '+') ? 1 : 0;
  if (i == b.size()) return false;
  for (; i < b.size(); ++i) {
    char c = b[i];
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    if (!ok) return false;
  }
  return true;
}

std::vector<std::string> JournalReader::build_argv(const puls::model::JournalQuery& q) {
  std::vector<std::string> argv{"journalctl", "--no-pager", "-o", "json", "-n", std::to_string(q.limit)};
  if (!q.unit.empty()) { argv.push_back("-u"); argv.push_back(q.unit); }
  if (q.max_priority >= 0) { argv.push_back("-p"); argv.push_back(std::to_string(q.max_priority)); }
  if (!q.boot.empty()) { argv.push_back("-b"); argv.push_back(q.boot); }
  return argv;
}

// journald exports every field as a string; binary-safe fields arrive as
// byte arrays
static std::string field_str(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (v.isString()) return v.asString();
  if (v.isArray()) {
    std::string s;
    for (const auto& b : v) if (b.isIntegral()) s.push_back(static_cast<char>(b.asInt()));
    return s;
  }
  if (v.isIntegral()) return std::to_string(v.asLargestInt());
  return {};
}

static long long field_num(const Json::Value& obj, const char* key, long long defv) {
  std::string s = field_str(obj, key);
  if (s.empty()) return defv;
  try { return std::stoll(s); } catch (const std::exception&) { return defv; }
}

size_t JournalReader::parse(const std::string& text, std::vector<puls::model::JournalEntry>& out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  size_t skipped = 0;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    // journalctl notices such as "-- No entries --"
    if (line.empty() || line.starts_with("--")) continue;
    Json::Value obj;
    std::string err;
    if (!reader->parse(line.data(), line.data() + line.size(), &obj, &err) || !obj.isObject()) {
      ++skipped;
      continue;
    }
    puls::model::JournalEntry e;
    e.timestamp_us = field_num(obj, "__REALTIME_TIMESTAMP", 0);
    e.priority = static_cast<int>(field_num(obj, "PRIORITY", 6));
    e.unit = field_str(obj, "_SYSTEMD_UNIT");
    if (e.unit.empty()) e.unit = field_str(obj, "UNIT");
    e.identifier = field_str(obj, "SYSLOG_IDENTIFIER");
    e.pid = static_cast<int32_t>(field_num(obj, "_PID", 0));
    e.message = field_str(obj, "MESSAGE");
    out.push_back(std::move(e));
  }
  return skipped;
}

ActionOutcome JournalReader::query(const puls::model::JournalQuery& q, std::vector<puls::model::JournalEntry>& out) {
  out.clear();
  if (q.limit <= 0) return ActionOutcome::fail(ActionStatus::InvalidArgument, "limit must be positive");
  if (q.max_priority > 7) return ActionOutcome::fail(ActionStatus::InvalidArgument, "priority must be 0..7");
  if (!q.unit.empty() && !ServiceManager::valid_unit_name(q.unit))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid unit name: " + q.unit);
  if (!q.boot.empty() && !valid_boot(q.boot))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid boot id: " + q.boot);

  auto res = runner_.run(build_argv(q));
  if (!res.spawned)
    return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, "journalctl not available", res.exit_code);
  if (res.exit_code != 0)
    return ActionOutcome::fail(ActionStatus::ExternalCommandFailed, res.output, res.exit_code);
  size_t skipped = parse(res.output, out);
  if (out.size() > static_cast<size_t>(q.limit))
    out.erase(out.begin(), out.begin() + static_cast<long>(out.size() - static_cast<size_t>(q.limit)));
  if (out.empty() && skipped > 0)
    return ActionOutcome::fail(ActionStatus::ParseError, "journalctl output was not JSON");
  return ActionOutcome::success(std::to_string(out.size()) + " entries");
}

} // namespace puls::control
