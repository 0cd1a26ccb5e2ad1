#include "control/PrivilegeGate.hpp"
#include <unistd.h>

namespace puls::control {

const char* to_string(Capability c) {
  switch (c) {
    case Capability::Full: return "full";
    case Capability::ReadOnly: return "read-only";
    case Capability::Safe: return "safe";
  }
  return "read-only";
}

Capability PrivilegeGate::resolve(bool effective_root, bool safe_requested) {
  if (safe_requested) return Capability::Safe;
  return effective_root ? Capability::Full : Capability::ReadOnly;
}

PrivilegeGate PrivilegeGate::detect(bool safe_requested) {
  return PrivilegeGate(resolve(::geteuid() == 0, safe_requested));
}

bool PrivilegeGate::allows_source(puls::model::SourceKind k) const {
  if (cap_ != Capability::Safe) return true;
  return k != puls::model::SourceKind::Gpu && k != puls::model::SourceKind::Container;
}

} // namespace puls::control
