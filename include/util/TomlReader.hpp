#pragma once

#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace puls::util {

// Flat [section] / key = value reader for config.toml. Nested tables, arrays
// and multi-line strings are not supported; unknown lines are skipped.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    size_t start = 0;
    while (start <= text.size()) {
      size_t end = text.find('\n', start);
      if (end == std::string_view::npos) end = text.size();
      auto sv = trim(text.substr(start, end - start));
      start = end + 1;
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto raw = trim(sv.substr(eq + 1));
      std::string val;
      if (!raw.empty() && (raw.front() == '"' || raw.front() == '\'')) {
        auto close = raw.find(raw.front(), 1);
        if (close == std::string_view::npos) continue; // unterminated string
        val = std::string(raw.substr(1, close - 1));
      } else {
        // bare values may carry a trailing comment
        auto hash = raw.find('#');
        val = std::string(trim(raw.substr(0, hash)));
      }
      ensure_section(current_section).set(key, val);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v) return def;
    auto b = parse_bool(*v);
    return b ? *b : def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  static std::optional<bool> parse_bool(std::string_view v) {
    std::string s(v);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    return std::nullopt;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& [n, s] : sections_) {
      if (n != section) continue;
      for (const auto& [k, v] : s.entries)
        if (k == key) return &v;
    }
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace puls::util
