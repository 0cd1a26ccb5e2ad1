#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "control/ActionOutcome.hpp"
#include "control/BootConfigEditor.hpp"
#include "control/JournalReader.hpp"
#include "control/PrivilegeGate.hpp"
#include "control/ServiceManager.hpp"
#include "util/Command.hpp"

namespace puls::control {

struct ControlOptions {
  BootConfigOptions boot{};
  int journal_limit{200};
};

// A destructive service action waiting for confirm().
struct PendingAction {
  uint64_t ticket{0};
  ServiceVerb verb{ServiceVerb::Stop};
  std::string unit;
};

// Privileged operations. Every mutating call checks the capability first
// and, without Full, returns PermissionDenied before anything runs.
// Calls are serialized against each other.
class ControlSubsystem {
public:
  ControlSubsystem(PrivilegeGate gate, puls::util::CommandRunner& runner, ControlOptions opts = {});

  [[nodiscard]] Capability capability() const { return gate_.capability(); }

  // Fresh from systemctl on every call.
  [[nodiscard]] ActionOutcome list_services(std::vector<puls::model::ServiceUnit>& out);
  // One unit, re-enumerated. InvalidArgument when systemd does not know it.
  [[nodiscard]] ActionOutcome service_status(const std::string& unit, puls::model::ServiceUnit& out);

  // start/enable run at once; stop/restart/disable return
  // ConfirmationRequired with a ticket and run only on confirm(ticket).
  [[nodiscard]] ActionOutcome request(ServiceVerb verb, const std::string& unit);
  [[nodiscard]] ActionOutcome confirm(uint64_t ticket);
  void cancel();
  [[nodiscard]] std::optional<PendingAction> pending() const;

  // Allowed under every capability.
  [[nodiscard]] ActionOutcome query_journal(puls::model::JournalQuery q, std::vector<puls::model::JournalEntry>& out);
  [[nodiscard]] ActionOutcome read_boot_config(GrubConfig& out);

  [[nodiscard]] ActionOutcome set_boot_param(const std::string& key, const std::string& value);

private:
  ActionOutcome denied(const char* what) const;
  ActionOutcome run_service(ServiceVerb verb, const std::string& unit);

  PrivilegeGate gate_;
  ServiceManager services_;
  JournalReader journal_;
  BootConfigEditor boot_;
  ControlOptions opts_;

  mutable std::mutex mu_;
  std::optional<PendingAction> pending_;
  uint64_t next_ticket_{1};
};

} // namespace puls::control
