#include "control/ControlSubsystem.hpp"
#include <cstdio>
#include <utility>

namespace puls::control {

const char* to_string(ActionStatus s) {
  switch (s) {
    case ActionStatus::Success: return "success";
    case ActionStatus::ConfirmationRequired: return "confirmation required";
    case ActionStatus::PermissionDenied: return "insufficient privilege";
    case ActionStatus::ExternalCommandFailed: return "command failed";
    case ActionStatus::ParseError: return "parse error";
    case ActionStatus::InvalidArgument: return "invalid argument";
    case ActionStatus::BackupFailed: return "backup failed";
    case ActionStatus::IoError: return "i/o error";
  }
  return "unknown";
}

ControlSubsystem::ControlSubsystem(PrivilegeGate gate, puls::util::CommandRunner& runner, ControlOptions opts)
  : gate_(gate), services_(runner), journal_(runner), boot_(opts.boot), opts_(std::move(opts)) {}

ActionOutcome ControlSubsystem::denied(const char* what) const {
  return ActionOutcome::fail(ActionStatus::PermissionDenied,
                             std::string(what) + " requires root (capability: " + to_string(gate_.capability()) + ")");
}

ActionOutcome ControlSubsystem::list_services(std::vector<puls::model::ServiceUnit>& out) {
  std::lock_guard<std::mutex> lk(mu_);
  return services_.list(out);
}

ActionOutcome ControlSubsystem::service_status(const std::string& unit, puls::model::ServiceUnit& out) {
  if (!ServiceManager::valid_unit_name(unit))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid unit name: " + unit);
  std::vector<puls::model::ServiceUnit> units;
  auto r = list_services(units);
  if (!r.ok()) return r;
  std::string name = ServiceManager::normalize(unit);
  for (auto& u : units) {
    if (u.name != name) continue;
    out = std::move(u);
    return ActionOutcome::success();
  }
  return ActionOutcome::fail(ActionStatus::InvalidArgument, "no such unit: " + name);
}

ActionOutcome ControlSubsystem::run_service(ServiceVerb verb, const std::string& unit) {
  auto r = services_.apply(verb, unit);
  if (!r.ok())
    std::fprintf(stderr, "puls: control: systemctl %s %s: %s\n", to_string(verb), unit.c_str(), r.detail.c_str());
  return r;
}

ActionOutcome ControlSubsystem::request(ServiceVerb verb, const std::string& unit) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!gate_.can_mutate()) return denied(to_string(verb));
  if (!ServiceManager::valid_unit_name(unit))
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "invalid unit name: " + unit);
  if (!needs_confirmation(verb)) return run_service(verb, unit);

  // a new request replaces any earlier unconfirmed one
  pending_ = PendingAction{next_ticket_++, verb, unit};
  ActionOutcome out;
  out.status = ActionStatus::ConfirmationRequired;
  out.detail = std::string(to_string(verb)) + " " + ServiceManager::normalize(unit) + "?";
  out.ticket = pending_->ticket;
  return out;
}

ActionOutcome ControlSubsystem::confirm(uint64_t ticket) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!gate_.can_mutate()) return denied("confirm");
  if (!pending_ || pending_->ticket != ticket)
    return ActionOutcome::fail(ActionStatus::InvalidArgument, "no pending action with ticket " + std::to_string(ticket));
  PendingAction act = *pending_;
  pending_.reset();
  return run_service(act.verb, act.unit);
}

void ControlSubsystem::cancel() {
  std::lock_guard<std::mutex> lk(mu_);
  pending_.reset();
}

std::optional<PendingAction> ControlSubsystem::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_;
}

ActionOutcome ControlSubsystem::query_journal(puls::model::JournalQuery q, std::vector<puls::model::JournalEntry>& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (q.limit <= 0 || q.limit > opts_.journal_limit) q.limit = opts_.journal_limit;
  return journal_.query(q, out);
}

ActionOutcome ControlSubsystem::read_boot_config(GrubConfig& out) {
  std::lock_guard<std::mutex> lk(mu_);
  return boot_.read(out);
}

ActionOutcome ControlSubsystem::set_boot_param(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!gate_.can_mutate()) return denied("boot config edit");
  return boot_.set_param(key, value);
}

} // namespace puls::control
