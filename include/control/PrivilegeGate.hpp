#pragma once
#include "model/Snapshot.hpp"

namespace puls::control {

// Fixed once at startup and never changes afterwards.
enum class Capability {
  Full,      // effective root: every operation permitted
  ReadOnly,  // unprivileged: polling and journal reads only
  Safe       // read-only, and GPU/container polling is switched off
};

const char* to_string(Capability c);

class PrivilegeGate {
public:
  explicit PrivilegeGate(Capability c = Capability::ReadOnly) : cap_(c) {}

  static Capability resolve(bool effective_root, bool safe_requested);
  // Uses geteuid().
  static PrivilegeGate detect(bool safe_requested);

  [[nodiscard]] Capability capability() const { return cap_; }
  [[nodiscard]] bool can_mutate() const { return cap_ == Capability::Full; }
  [[nodiscard]] bool allows_source(puls::model::SourceKind k) const;

private:
  Capability cap_;
};

} // namespace puls::control
