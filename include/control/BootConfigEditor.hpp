#pragma once
#include <ctime>
#include <string>
#include "control/ActionOutcome.hpp"
#include "control/GrubConfig.hpp"

namespace puls::control {

struct BootConfigOptions {
  std::string path{"/etc/default/grub"};
  std::string backup_dir;  // empty: next to the file
};

// Read -> parse -> edit in memory -> timestamped backup -> replace.
// A failure at any step leaves the file as it was.
class BootConfigEditor {
public:
  explicit BootConfigEditor(BootConfigOptions opts) : opts_(std::move(opts)) {}

  [[nodiscard]] ActionOutcome read(GrubConfig& out) const;

  // On success detail holds the backup path.
  [[nodiscard]] ActionOutcome set_param(const std::string& key, const std::string& value);

  [[nodiscard]] const BootConfigOptions& options() const { return opts_; }

  // <dir>/<file>.bak.YYYYmmdd-HHMMSS
  static std::string backup_path(const std::string& path, const std::string& dir, std::time_t when);

private:
  ActionOutcome read_text(std::string& text) const;
  ActionOutcome write_backup(const std::string& text, std::string& written) const;
  ActionOutcome replace_file(const std::string& text) const;

  BootConfigOptions opts_;
};

} // namespace puls::control
