#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* kEnvNames[] = {
  "PULS_SAFE_MODE", "PULS_REFRESH_MS", "PULS_HISTORY_LENGTH", "PULS_SOURCE_TIMEOUT_MS",
  "PULS_STALE_TICKS", "PULS_SOURCE_GPU", "PULS_SOURCE_CONTAINERS", "PULS_SORT",
  "PULS_CPU_WEIGHT", "PULS_GRUB_PATH", "PULS_JOURNAL_LIMIT", "puls_refresh_ms",
};

static void clear_env() {
  for (auto* n : kEnvNames) ::unsetenv(n);
}

static std::string write_config(const char* tag, const std::string& body) {
  fs::path dir = fs::temp_directory_path() / "puls_test_config_" / std::to_string(::getpid());
  fs::create_directories(dir);
  fs::path p = dir / (std::string(tag) + ".toml");
  std::ofstream(p) << body;
  return p.string();
}

TEST(config_defaults_without_file) {
  clear_env();
  auto c = puls::app::load_config("/nonexistent/puls/config.toml");
  ASSERT_EQ(c.general.safe_mode, false);
  ASSERT_EQ(c.general.refresh_ms, 1000);
  ASSERT_EQ(c.general.history_length, 60);
  ASSERT_EQ(c.general.source_timeout_ms, 500);
  ASSERT_EQ(c.general.stale_ticks, 3);
  ASSERT_EQ(c.sources.gpu, true);
  ASSERT_EQ(c.process.sort, std::string("cpu"));
  ASSERT_EQ(c.process.cpu_weight, 60);
  ASSERT_EQ(c.process.mem_weight, 40);
  ASSERT_EQ(c.nvidia.smi_path, std::string("auto"));
  ASSERT_EQ(c.control.grub_path, std::string("/etc/default/grub"));
  ASSERT_EQ(c.control.journal_limit, 200);
}

TEST(config_toml_overrides_env) {
  clear_env();
  ::setenv("PULS_REFRESH_MS", "250", 1);
  ::setenv("PULS_STALE_TICKS", "7", 1);
  auto path = write_config("override",
    "[general]\n"
    "refresh_ms = 2000\n"
    "[sources]\n"
    "gpu = false\n"
    "[process]\n"
    "sort = General\n");
  auto c = puls::app::load_config(path);
  ASSERT_EQ(c.general.refresh_ms, 2000);
  // not in the file: env applies
  ASSERT_EQ(c.general.stale_ticks, 7);
  ASSERT_EQ(c.sources.gpu, false);
  ASSERT_EQ(c.process.sort, std::string("general"));
  // timeout follows the configured refresh interval
  ASSERT_EQ(c.general.source_timeout_ms, 1000);
  clear_env();
}

TEST(config_env_lowercase_alias) {
  clear_env();
  ::setenv("puls_refresh_ms", "300", 1);
  ::setenv("PULS_SOURCE_CONTAINERS", "off", 1);
  ::setenv("PULS_SAFE_MODE", "yes", 1);
  auto c = puls::app::load_config("");
  ASSERT_EQ(c.general.refresh_ms, 300);
  ASSERT_EQ(c.sources.containers, false);
  ASSERT_EQ(c.general.safe_mode, true);
  clear_env();
}

TEST(config_values_are_clamped) {
  clear_env();
  auto path = write_config("clamp",
    "[general]\n"
    "refresh_ms = 5\n"
    "history_length = 100000\n"
    "stale_ticks = -4\n"
    "[process]\n"
    "cpu_weight = 250\n"
    "[control]\n"
    "journal_limit = 0\n");
  auto c = puls::app::load_config(path);
  ASSERT_EQ(c.general.refresh_ms, 100);
  ASSERT_EQ(c.general.history_length, 300);
  ASSERT_EQ(c.general.stale_ticks, 0);
  ASSERT_EQ(c.process.cpu_weight, 100);
  ASSERT_EQ(c.control.journal_limit, 1);
}

TEST(config_timeout_stays_below_refresh) {
  clear_env();
  auto path = write_config("timeout",
    "[general]\n"
    "refresh_ms = 500\n"
    "source_timeout_ms = 9000\n");
  auto c = puls::app::load_config(path);
  ASSERT_EQ(c.general.refresh_ms, 500);
  ASSERT_TRUE(c.general.source_timeout_ms < c.general.refresh_ms);
}

TEST(config_bad_integer_falls_back) {
  clear_env();
  ::setenv("PULS_JOURNAL_LIMIT", "lots", 1);
  auto c = puls::app::load_config("");
  ASSERT_EQ(c.control.journal_limit, 200);
  clear_env();
}

TEST(config_file_path_prefers_xdg) {
  const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old_xdg ? old_xdg : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/puls_xdg", 1);
  ASSERT_EQ(puls::app::config_file_path(), std::string("/tmp/puls_xdg/puls/config.toml"));
  ::unsetenv("XDG_CONFIG_HOME");
  ::setenv("HOME", "/home/someone", 1);
  ASSERT_EQ(puls::app::config_file_path(), std::string("/home/someone/.config/puls/config.toml"));
  if (old_xdg) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
}
