#pragma once
#include <string>
#include <vector>
#include "control/ActionOutcome.hpp"
#include "model/Service.hpp"
#include "util/Command.hpp"

namespace puls::control {

// Read-only journal access through `journalctl -o json`.
class JournalReader {
public:
  explicit JournalReader(puls::util::CommandRunner& runner) : runner_(runner) {}

  // Entries oldest first, at most q.limit.
  [[nodiscard]] ActionOutcome query(const puls::model::JournalQuery& q, std::vector<puls::model::JournalEntry>& out);

  static std::vector<std::string> build_argv(const puls::model::JournalQuery& q);

  // One JSON object per line; lines that are not JSON objects are skipped.
  // Returns the number of skipped lines.
  static size_t parse(const std::string& text, std::vector<puls::model::JournalEntry>& out);

private:
  puls::util::CommandRunner& runner_;
};

} // namespace puls::control
