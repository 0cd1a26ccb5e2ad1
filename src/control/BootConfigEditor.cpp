#include "control/BootConfigEditor.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace puls::control {

std::string BootConfigEditor::backup_path(const std::string& path, const std::string& dir, std::time_t when) {
  std::filesystem::path p(path);
  std::filesystem::path base = dir.empty() ? p.parent_path() : std::filesystem::path(dir);
  std::tm tm{};
  ::localtime_r(&when, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);
  return (base / (p.filename().string() + ".bak." + stamp)).string();
}

// Full write loop; false on any short write.
static bool write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

ActionOutcome BootConfigEditor::read_text(std::string& text) const {
  std::ifstream f(opts_.path, std::ios::binary);
  if (!f) return ActionOutcome::fail(ActionStatus::IoError, "cannot read " + opts_.path + ": " + std::strerror(errno));
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) return ActionOutcome::fail(ActionStatus::IoError, "read error on " + opts_.path);
  text = ss.str();
  return ActionOutcome::success();
}

ActionOutcome BootConfigEditor::read(GrubConfig& out) const {
  std::string text;
  auto r = read_text(text);
  if (!r.ok()) return r;
  std::string err;
  if (!GrubConfig::parse(text, out, err))
    return ActionOutcome::fail(ActionStatus::ParseError, opts_.path + ": " + err);
  return ActionOutcome::success();
}

ActionOutcome BootConfigEditor::write_backup(const std::string& text, std::string& written) const {
  std::string base = backup_path(opts_.path, opts_.backup_dir, std::time(nullptr));
  // two edits within one second get distinct names
  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string cand = attempt == 0 ? base : base + "." + std::to_string(attempt);
    int fd = ::open(cand.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
      if (errno == EEXIST) continue;
      return ActionOutcome::fail(ActionStatus::BackupFailed, "cannot create " + cand + ": " + std::strerror(errno));
    }
    bool ok = write_all(fd, text) && ::fsync(fd) == 0;
    int saved = errno;
    if (::close(fd) != 0) ok = false;
    if (!ok) {
      ::unlink(cand.c_str());
      return ActionOutcome::fail(ActionStatus::BackupFailed, "cannot write " + cand + ": " + std::strerror(saved));
    }
    written = cand;
    return ActionOutcome::success(cand);
  }
  return ActionOutcome::fail(ActionStatus::BackupFailed, "no free backup name for " + base);
}

ActionOutcome BootConfigEditor::replace_file(const std::string& text) const {
  struct stat st{};
  mode_t mode = 0644;
  if (::stat(opts_.path.c_str(), &st) == 0) mode = st.st_mode & 07777;
  std::string tmp = opts_.path + ".puls-tmp." + std::to_string(::getpid());
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0) return ActionOutcome::fail(ActionStatus::IoError, "cannot create " + tmp + ": " + std::strerror(errno));
  bool ok = write_all(fd, text) && ::fchmod(fd, mode) == 0 && ::fsync(fd) == 0;
  int saved = errno;
  if (::close(fd) != 0) ok = false;
  if (!ok || ::rename(tmp.c_str(), opts_.path.c_str()) != 0) {
    if (ok) saved = errno;
    ::unlink(tmp.c_str());
    return ActionOutcome::fail(ActionStatus::IoError, "cannot replace " + opts_.path + ": " + std::strerror(saved));
  }
  return ActionOutcome::success();
}

ActionOutcome BootConfigEditor::set_param(const std::string& key, const std::string& value) {
  if (!GrubConfig::valid_key(key))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid key: " + key);
  if (!GrubConfig::valid_value(value))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "value must be a single line");

  std::string original;
  auto r = read_text(original);
  if (!r.ok()) return r;
  GrubConfig cfg;
  std::string err;
  if (!GrubConfig::parse(original, cfg, err))
    return ActionOutcome::fail(ActionStatus::ParseError, opts_.path + ": " + err);
  cfg.set(key, value);

  std::string backup;
  r = write_backup(original, backup);
  if (!r.ok()) {
    std::fprintf(stderr, "puls: bootcfg: %s\n", r.detail.c_str());
    return r;
  }
  r = replace_file(cfg.serialize());
  if (!r.ok()) {
    std::fprintf(stderr, "puls: bootcfg: %s (backup kept at %s)\n", r.detail.c_str(), backup.c_str());
    return r;
  }
  std::fprintf(stderr, "puls: bootcfg: %s updated, backup %s\n", key.c_str(), backup.c_str());
  return ActionOutcome::success(backup);
}

} // namespace puls::control
