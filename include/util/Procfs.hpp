// C++23 utility helpers for reading /proc and /sys with optional root remap
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace puls::util {

// Map an absolute /proc path to an alternate root if PULS_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if PULS_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string. /proc and /sys paths are remapped. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// Read a file holding a single integer (sysfs attributes, hwmon inputs).
auto read_file_int(const std::string& abs) -> std::optional<long long>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

auto trim(std::string_view sv) -> std::string_view;

} // namespace puls::util
