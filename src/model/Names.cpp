#include "model/Snapshot.hpp"

namespace puls::model {

const char* to_string(SourceKind k) {
  switch (k) {
    case SourceKind::Host: return "host";
    case SourceKind::Disk: return "disk";
    case SourceKind::Net: return "network";
    case SourceKind::Process: return "process";
    case SourceKind::Gpu: return "gpu";
    case SourceKind::Container: return "container";
  }
  return "?";
}

const char* to_string(SourceStatus s) {
  switch (s) {
    case SourceStatus::Ok: return "ok";
    case SourceStatus::TimedOut: return "timed out";
    case SourceStatus::Unavailable: return "unavailable";
    case SourceStatus::Error: return "error";
  }
  return "?";
}

const char* to_string(SourceState s) {
  switch (s) {
    case SourceState::Live: return "live";
    case SourceState::Stale: return "stale";
    case SourceState::NotAvailable: return "n/a";
    case SourceState::Disabled: return "disabled";
  }
  return "?";
}

const char* to_string(GpuVendor v) {
  switch (v) {
    case GpuVendor::Nvidia: return "NVIDIA";
    case GpuVendor::Amd: return "AMD";
    case GpuVendor::Intel: return "INTEL";
  }
  return "?";
}

const char* to_string(ContainerHealth h) {
  switch (h) {
    case ContainerHealth::None: return "none";
    case ContainerHealth::Starting: return "starting";
    case ContainerHealth::Healthy: return "healthy";
    case ContainerHealth::Unhealthy: return "unhealthy";
  }
  return "?";
}

} // namespace puls::model
