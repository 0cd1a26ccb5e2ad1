#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace puls::util {

struct CommandResult {
  bool spawned{false};   // false if the shell could not be started
  int exit_code{-1};     // WEXITSTATUS, or -1 when killed by a signal
  std::string output;    // stdout with stderr merged
};

// Runs external tools (systemctl, journalctl, nvidia-smi). Tests substitute
// a scripted runner so no real command is executed.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  [[nodiscard]] virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

class PopenCommandRunner : public CommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::vector<std::string>& argv) override;
};

// Single-quote an argument for /bin/sh.
std::string shell_quote(std::string_view arg);

// Locate an executable in $PATH and a few well-known directories.
std::string find_executable(const std::string& name);

} // namespace puls::util
