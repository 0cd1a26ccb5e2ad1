#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace puls::control {

enum class ActionStatus {
  Success,
  ConfirmationRequired,   // nothing ran; confirm(ticket) to proceed
  PermissionDenied,       // capability insufficient; nothing attempted
  ExternalCommandFailed,  // tool missing or exited non-zero; output kept verbatim
  ParseError,             // malformed external data; nothing written
  InvalidArgument,        // bad unit name, key or query
  BackupFailed,           // boot config untouched
  IoError                 // read or write of the boot config failed
};

const char* to_string(ActionStatus s);

struct ActionOutcome {
  ActionStatus status{ActionStatus::Success};
  std::string detail;
  int exit_code{0};
  uint64_t ticket{0};     // set with ConfirmationRequired

  [[nodiscard]] bool ok() const { return status == ActionStatus::Success; }

  static ActionOutcome success(std::string d = {}) { return {ActionStatus::Success, std::move(d), 0, 0}; }
  static ActionOutcome fail(ActionStatus s, std::string d, int code = 0) { return {s, std::move(d), code, 0}; }
};

} // namespace puls::control
