#pragma once

#include <string>

namespace puls::app {

// Runtime configuration. Every key resolves config.toml -> environment
// variable -> compiled default, then is clamped to its valid range.
struct AppConfig {
  struct General {
    bool safe_mode{false};
    int  refresh_ms{1000};        // 100..10000
    int  history_length{60};      // 10..300
    int  source_timeout_ms{500};  // defaults to half the refresh interval
    int  stale_ticks{3};          // K: ticks a missed source keeps its last value
  } general;

  struct Sources {
    bool gpu{true};
    bool containers{true};
    bool network{true};
    bool disk{true};
  } sources;

  struct Process {
    bool show_system{false};
    std::string sort{"cpu"};      // cpu, mem, name, pid, general, io
    bool ascending{false};
    int  cpu_weight{60};          // "general" score weights, percent
    int  mem_weight{40};
  } process;

  struct Nvidia {
    std::string smi_path{"auto"};
    bool disable_nvml{false};
    std::string nvml_path;
  } nvidia;

  struct Containers {
    std::string socket;           // empty: probe the usual locations
  } containers;

  struct Control {
    std::string grub_path{"/etc/default/grub"};
    std::string backup_dir;       // empty: beside the file
    int journal_limit{200};
  } control;
};

// Loads from config_file_path() (missing file is fine).
AppConfig load_config();
// Loads from an explicit path; used by tests and --config style overrides.
AppConfig load_config(const std::string& path);

std::string config_file_path();

// Environment variable helpers (PULS_FOO also accepted as puls_foo)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace puls::app
