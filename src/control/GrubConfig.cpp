#include "control/GrubConfig.hpp"
#include <cctype>

namespace puls::control {

static bool key_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
static bool key_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

bool GrubConfig::valid_key(const std::string& key) {
  if (key.empty() || !key_start(key[0])) return false;
  for (char c : key) if (!key_char(c)) return false;
  return true;
}

bool GrubConfig::valid_value(const std::string& value) {
  for (char c : value) if (c == '\n' || c == '\r' || c == '\0') return false;
  return true;
}

std::string GrubConfig::quote(const std::string& value) {
  std::string out = "\"";
  for (char c : value) {
    if (c == '\\' || c == '"' || c == '$' || c == '`') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Parses one line. Returns false on an unterminated quote.
static bool parse_line(const std::string& raw, GrubConfig::Line& ln) {
  ln = GrubConfig::Line{};
  ln.raw = raw;
  size_t i = 0;
  while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t')) ++i;
  if (i >= raw.size() || raw[i] == '#') return true;
  if (raw.compare(i, 7, "export ") == 0) {
    i += 7;
    while (i < raw.size() && raw[i] == ' ') ++i;
  }
  size_t ks = i;
  if (i >= raw.size() || !key_start(raw[i])) return true;
  while (i < raw.size() && key_char(raw[i])) ++i;
  if (i >= raw.size() || raw[i] != '=') return true;
  std::string key = raw.substr(ks, i - ks);
  ++i;
  size_t vs = i;

  std::string value;
  while (i < raw.size()) {
    char c = raw[i];
    // '#' starts a comment only at the start of a word
    if (c == ' ' || c == '\t' || c == ';') break;
    if (c == '"') {
      ++i;
      bool closed = false;
      while (i < raw.size()) {
        char d = raw[i];
        if (d == '\\' && i + 1 < raw.size()) {
          char n = raw[i + 1];
          if (n == '"' || n == '\\' || n == '$' || n == '`') { value.push_back(n); i += 2; continue; }
          value.push_back(d); ++i; continue;
        }
        if (d == '"') { closed = true; ++i; break; }
        value.push_back(d); ++i;
      }
      if (!closed) return false;
    } else if (c == '\'') {
      size_t end = raw.find('\'', i + 1);
      if (end == std::string::npos) return false;
      value.append(raw, i + 1, end - i - 1);
      i = end + 1;
    } else if (c == '\\' && i + 1 < raw.size()) {
      value.push_back(raw[i + 1]);
      i += 2;
    } else {
      value.push_back(c);
      ++i;
    }
  }
  ln.assignment = true;
  ln.key = std::move(key);
  ln.value = std::move(value);
  ln.prefix = raw.substr(0, vs);
  ln.suffix = raw.substr(i);
  return true;
}

bool GrubConfig::parse(const std::string& text, GrubConfig& out, std::string& err) {
  GrubConfig cfg;
  cfg.trailing_newline_ = text.empty() || text.back() == '\n';
  size_t start = 0;
  size_t lineno = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    std::string raw = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    ++lineno;
    Line ln;
    if (!parse_line(raw, ln)) {
      err = "line " + std::to_string(lineno) + ": unterminated quote";
      return false;
    }
    cfg.lines_.push_back(std::move(ln));
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  out = std::move(cfg);
  return true;
}

std::string GrubConfig::serialize() const {
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    out += lines_[i].raw;
    if (i + 1 < lines_.size() || trailing_newline_) out.push_back('\n');
  }
  return out;
}

std::vector<std::pair<std::string, std::string>> GrubConfig::entries() const {
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto& ln : lines_) if (ln.assignment) out.emplace_back(ln.key, ln.value);
  return out;
}

std::optional<std::string> GrubConfig::get(const std::string& key) const {
  for (auto it = lines_.rbegin(); it != lines_.rend(); ++it)
    if (it->assignment && it->key == key) return it->value;
  return std::nullopt;
}

void GrubConfig::set(const std::string& key, const std::string& value) {
  for (auto it = lines_.rbegin(); it != lines_.rend(); ++it) {
    if (it->assignment && it->key == key) {
      it->value = value;
      it->raw = it->prefix + quote(value) + it->suffix;
      return;
    }
  }
  Line ln;
  ln.assignment = true;
  ln.key = key;
  ln.value = value;
  ln.prefix = key + "=";
  ln.raw = ln.prefix + quote(value);
  // an appended line always leaves the file newline-terminated
  trailing_newline_ = true;
  lines_.push_back(std::move(ln));
}

} // namespace puls::control
