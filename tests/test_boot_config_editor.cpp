#include "minitest.hpp"
#include "control/BootConfigEditor.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using puls::control::ActionStatus;
using puls::control::BootConfigEditor;
using puls::control::BootConfigOptions;

static const char* kGrub =
  "GRUB_DEFAULT=0\n"
  "GRUB_TIMEOUT=5\n"
  "GRUB_CMDLINE_LINUX_DEFAULT=\"quiet\"\n";

static fs::path fresh_dir(const char* tag) {
  fs::path d = fs::temp_directory_path() / "puls_test_bootcfg_" / (std::string(tag) + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

static void spit(const fs::path& p, const std::string& s) {
  std::ofstream(p, std::ios::binary) << s;
}

TEST(bootcfg_set_writes_backup_then_file) {
  auto dir = fresh_dir("set");
  auto grub = dir / "grub";
  spit(grub, kGrub);
  ::chmod(grub.c_str(), 0640);

  BootConfigEditor ed(BootConfigOptions{grub.string(), ""});
  auto r = ed.set_param("GRUB_TIMEOUT", "2");
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(fs::exists(r.detail));
  ASSERT_EQ(fs::path(r.detail).parent_path(), dir);
  ASSERT_TRUE(fs::path(r.detail).filename().string().starts_with("grub.bak."));
  ASSERT_EQ(slurp(r.detail), std::string(kGrub));

  std::string now = slurp(grub);
  ASSERT_TRUE(now.find("GRUB_TIMEOUT=\"2\"\n") != std::string::npos);
  ASSERT_TRUE(now.find("GRUB_CMDLINE_LINUX_DEFAULT=\"quiet\"") != std::string::npos);
  struct stat st{};
  ASSERT_EQ(::stat(grub.c_str(), &st), 0);
  ASSERT_EQ(st.st_mode & 07777, 0640u);
  // no temp file left behind
  size_t files = 0;
  for (auto& e : fs::directory_iterator(dir)) { (void)e; ++files; }
  ASSERT_EQ(files, 2u);
  fs::remove_all(dir);
}

TEST(bootcfg_second_edit_gets_distinct_backup) {
  auto dir = fresh_dir("twice");
  auto grub = dir / "grub";
  spit(grub, kGrub);
  auto bdir = dir / "backups";
  fs::create_directories(bdir);
  BootConfigEditor ed(BootConfigOptions{grub.string(), bdir.string()});
  auto a = ed.set_param("GRUB_TIMEOUT", "1");
  auto b = ed.set_param("GRUB_TIMEOUT", "3");
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  ASSERT_NE(a.detail, b.detail);
  ASSERT_EQ(fs::path(a.detail).parent_path(), bdir);
  ASSERT_TRUE(slurp(b.detail).find("GRUB_TIMEOUT=\"1\"") != std::string::npos);
  fs::remove_all(dir);
}

TEST(bootcfg_backup_failure_leaves_file_untouched) {
  auto dir = fresh_dir("nobackup");
  auto grub = dir / "grub";
  spit(grub, kGrub);
  BootConfigEditor ed(BootConfigOptions{grub.string(), (dir / "missing" / "dir").string()});
  auto r = ed.set_param("GRUB_TIMEOUT", "9");
  ASSERT_TRUE(r.status == ActionStatus::BackupFailed);
  ASSERT_EQ(slurp(grub), std::string(kGrub));
  fs::remove_all(dir);
}

TEST(bootcfg_parse_error_leaves_file_untouched) {
  auto dir = fresh_dir("parse");
  auto grub = dir / "grub";
  std::string broken = "GRUB_DEFAULT=0\nGRUB_CMDLINE_LINUX=\"unterminated\n";
  spit(grub, broken);
  BootConfigEditor ed(BootConfigOptions{grub.string(), ""});
  auto r = ed.set_param("GRUB_DEFAULT", "1");
  ASSERT_TRUE(r.status == ActionStatus::ParseError);
  ASSERT_EQ(slurp(grub), broken);
  size_t files = 0;
  for (auto& e : fs::directory_iterator(dir)) { (void)e; ++files; }
  ASSERT_EQ(files, 1u);
  fs::remove_all(dir);
}

TEST(bootcfg_invalid_input_and_missing_file) {
  auto dir = fresh_dir("invalid");
  BootConfigEditor missing(BootConfigOptions{(dir / "nope").string(), ""});
  ASSERT_TRUE(missing.set_param("GRUB_DEFAULT", "1").status == ActionStatus::IoError);
  puls::control::GrubConfig cfg;
  ASSERT_TRUE(missing.read(cfg).status == ActionStatus::IoError);

  auto grub = dir / "grub";
  spit(grub, kGrub);
  BootConfigEditor ed(BootConfigOptions{grub.string(), ""});
  ASSERT_TRUE(ed.set_param("BAD KEY", "1").status == ActionStatus::InvalidArgument);
  ASSERT_TRUE(ed.set_param("GRUB_DEFAULT", "a\nb").status == ActionStatus::InvalidArgument);
  ASSERT_TRUE(ed.read(cfg).ok());
  ASSERT_EQ(*cfg.get("GRUB_TIMEOUT"), std::string("5"));
  fs::remove_all(dir);
}

TEST(bootcfg_backup_path_format) {
  std::tm tm{};
  tm.tm_year = 2024 - 1900; tm.tm_mon = 2; tm.tm_mday = 7;
  tm.tm_hour = 9; tm.tm_min = 5; tm.tm_sec = 1; tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  ASSERT_EQ(BootConfigEditor::backup_path("/etc/default/grub", "", t),
            std::string("/etc/default/grub.bak.20240307-090501"));
  ASSERT_EQ(BootConfigEditor::backup_path("/etc/default/grub", "/var/backups", t),
            std::string("/var/backups/grub.bak.20240307-090501"));
}
