#pragma once
#include <string>
#include <vector>
#include "control/ActionOutcome.hpp"
#include "model/Service.hpp"
#include "util/Command.hpp"

namespace puls::control {

enum class ServiceVerb { Start, Stop, Restart, Enable, Disable };

const char* to_string(ServiceVerb v);
// stop, restart and disable take a service away from users
bool needs_confirmation(ServiceVerb v);

// systemd service enumeration and lifecycle via systemctl. Performs no
// privilege checks of its own; ControlSubsystem gates every call.
class ServiceManager {
public:
  explicit ServiceManager(puls::util::CommandRunner& runner) : runner_(runner) {}

  // Every installed service, running or not, sorted by name. Fresh each call.
  [[nodiscard]] ActionOutcome list(std::vector<puls::model::ServiceUnit>& out);

  [[nodiscard]] ActionOutcome apply(ServiceVerb verb, const std::string& unit);

  // Unit names are restricted to the systemd alphabet plus '@', and must
  // not start with '-' so they can never be read as an option.
  static bool valid_unit_name(const std::string& unit);

  // "foo" -> "foo.service"; names with a unit suffix are kept as-is.
  static std::string normalize(const std::string& unit);

  // Parsers for systemctl --plain --no-legend output.
  static void parse_list_units(const std::string& text, std::vector<puls::model::ServiceUnit>& out);
  static void parse_unit_files(const std::string& text, std::vector<puls::model::ServiceUnit>& out);

private:
  puls::util::CommandRunner& runner_;
};

} // namespace puls::control
