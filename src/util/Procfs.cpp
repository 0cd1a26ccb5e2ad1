#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace puls::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "PULS_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "PULS_SYS_ROOT");
}

static std::string map_any(const std::string& abs) {
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return map_proc_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // a process can exit between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::ifstream in(map_any(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return buf;
}

auto read_file_int(const std::string& abs) -> std::optional<long long> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  auto sv = trim(*txt);
  long long v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc() || ptr == sv.data()) return std::nullopt;
  return v;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_any(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto trim(std::string_view sv) -> std::string_view {
  auto issp = [](char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!sv.empty() && issp(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && issp(sv.back())) sv.remove_suffix(1);
  return sv;
}

} // namespace puls::util
