#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace puls::control {

// /etc/default/grub as shell-style KEY=value assignments over the verbatim
// line list. serialize() reproduces the input byte-for-byte until set()
// touches a line, and set() rewrites only that line.
class GrubConfig {
public:
  struct Line {
    std::string raw;       // without the newline
    bool assignment{false};
    std::string key;
    std::string value;     // unquoted
    std::string prefix;    // raw text up to and including '='
    std::string suffix;    // raw text after the value (spaces, comment)
  };

  // Returns false and sets err (with the 1-based line number) on an
  // unterminated quote; `out` is left untouched then.
  static bool parse(const std::string& text, GrubConfig& out, std::string& err);

  [[nodiscard]] std::string serialize() const;

  // Assignments in file order. A key assigned twice appears twice.
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> entries() const;
  // Last assignment wins, as in the shell.
  [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

  // Rewrites the last assignment of key, or appends KEY="value".
  void set(const std::string& key, const std::string& value);

  [[nodiscard]] const std::vector<Line>& lines() const { return lines_; }

  static bool valid_key(const std::string& key);
  static bool valid_value(const std::string& value);
  // Double-quoted form with \ " $ ` escaped.
  static std::string quote(const std::string& value);

private:
  std::vector<Line> lines_;
  bool trailing_newline_{true};
};

} // namespace puls::control
