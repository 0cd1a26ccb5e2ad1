#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace puls::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  std::string alt;
  if (n.starts_with("PULS_")) alt = "puls_" + n.substr(5);
  else if (n.starts_with("puls_")) alt = "PULS_" + n.substr(5);
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  auto b = puls::util::TomlReader::parse_bool(v);
  return b ? *b : defv;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/puls/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/puls/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const puls::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const puls::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const puls::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v) return std::string(v);
  }
  return def;
}

AppConfig load_config(const std::string& path) {
  AppConfig c{};
  puls::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [general] ---
  c.general.safe_mode      = resolve_bool(toml, have_toml, "general", "safe_mode", "PULS_SAFE_MODE", false);
  c.general.refresh_ms     = std::clamp(resolve_int(toml, have_toml, "general", "refresh_ms", "PULS_REFRESH_MS", 1000), 100, 10000);
  c.general.history_length = std::clamp(resolve_int(toml, have_toml, "general", "history_length", "PULS_HISTORY_LENGTH", 60), 10, 300);
  // the timeout must stay below the tick interval or a hung source stalls the tick
  int timeout = resolve_int(toml, have_toml, "general", "source_timeout_ms", "PULS_SOURCE_TIMEOUT_MS", c.general.refresh_ms / 2);
  c.general.source_timeout_ms = std::clamp(timeout, 10, c.general.refresh_ms - 10);
  c.general.stale_ticks    = std::clamp(resolve_int(toml, have_toml, "general", "stale_ticks", "PULS_STALE_TICKS", 3), 0, 60);

  // --- [sources] ---
  c.sources.gpu        = resolve_bool(toml, have_toml, "sources", "gpu",        "PULS_SOURCE_GPU", true);
  c.sources.containers = resolve_bool(toml, have_toml, "sources", "containers", "PULS_SOURCE_CONTAINERS", true);
  c.sources.network    = resolve_bool(toml, have_toml, "sources", "network",    "PULS_SOURCE_NETWORK", true);
  c.sources.disk       = resolve_bool(toml, have_toml, "sources", "disk",       "PULS_SOURCE_DISK", true);

  // --- [process] ---
  c.process.show_system = resolve_bool(toml, have_toml, "process", "show_system", "PULS_SHOW_SYSTEM", false);
  c.process.sort        = resolve_string(toml, have_toml, "process", "sort", "PULS_SORT", "cpu");
  for (auto& ch : c.process.sort) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  c.process.ascending   = resolve_bool(toml, have_toml, "process", "ascending", "PULS_SORT_ASCENDING", false);
  c.process.cpu_weight  = std::clamp(resolve_int(toml, have_toml, "process", "cpu_weight", "PULS_CPU_WEIGHT", 60), 0, 100);
  c.process.mem_weight  = std::clamp(resolve_int(toml, have_toml, "process", "mem_weight", "PULS_MEM_WEIGHT", 40), 0, 100);

  // --- [nvidia] ---
  c.nvidia.smi_path     = resolve_string(toml, have_toml, "nvidia", "smi_path",     "PULS_NVIDIA_SMI_PATH", "auto");
  c.nvidia.disable_nvml = resolve_bool(toml, have_toml, "nvidia", "disable_nvml",   "PULS_DISABLE_NVML", false);
  c.nvidia.nvml_path    = resolve_string(toml, have_toml, "nvidia", "nvml_path",    "PULS_NVML_PATH", "");

  // --- [containers] ---
  c.containers.socket = resolve_string(toml, have_toml, "containers", "socket", "PULS_CONTAINER_SOCKET", "");

  // --- [control] ---
  c.control.grub_path     = resolve_string(toml, have_toml, "control", "grub_path", "PULS_GRUB_PATH", "/etc/default/grub");
  c.control.backup_dir    = resolve_string(toml, have_toml, "control", "backup_dir", "PULS_BACKUP_DIR", "");
  c.control.journal_limit = std::clamp(resolve_int(toml, have_toml, "control", "journal_limit", "PULS_JOURNAL_LIMIT", 200), 1, 10000);
  return c;
}

AppConfig load_config() {
  return load_config(config_file_path());
}

} // namespace puls::app
