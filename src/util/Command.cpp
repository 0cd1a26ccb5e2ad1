#include "util/Command.hpp"

#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace puls::util {

std::string shell_quote(std::string_view arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string find_executable(const std::string& name) {
  if (name.find('/') != std::string::npos) return name;
  std::error_code ec;
  if (const char* path = std::getenv("PATH"); path && *path) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (std::filesystem::exists(cand, ec)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  for (const char* dir : {"/usr/bin", "/usr/local/bin", "/bin", "/usr/sbin", "/sbin"}) {
    std::string cand = std::string(dir) + "/" + name;
    if (std::filesystem::exists(cand, ec)) return cand;
  }
  return {};
}

CommandResult PopenCommandRunner::run(const std::vector<std::string>& argv) {
  CommandResult res;
  if (argv.empty()) return res;
  std::string cmd;
  for (const auto& a : argv) {
    if (!cmd.empty()) cmd.push_back(' ');
    cmd += shell_quote(a);
  }
  cmd += " 2>&1";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    std::fprintf(stderr, "puls: command: popen failed for %s\n", argv.front().c_str());
    return res;
  }
  res.spawned = true;
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) res.output.append(buf, n);
  int status = ::pclose(fp);
  if (status == -1) res.exit_code = -1;
  else if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  else res.exit_code = -1;
  // sh reports 127 when the tool itself is missing
  if (res.exit_code == 127) res.spawned = false;
  return res;
}

} // namespace puls::util
