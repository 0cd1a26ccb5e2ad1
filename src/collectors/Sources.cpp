#include "collectors/Sources.hpp"

using puls::model::SourceStatus;

namespace puls::collectors {

PollResult HostSource::poll() {
  puls::model::HostSnapshot h;
  if (!cpu_.sample(h.cpu)) return PollResult::fail(SourceStatus::Error, "/proc/stat unreadable");
  if (!mem_.sample(h.mem)) return PollResult::fail(SourceStatus::Error, "/proc/meminfo unreadable");
  // no sensor is a normal condition (VMs, containers)
  (void)thermal_.sample(h.thermal);
  (void)info_.sample(h);
  return PollResult::ok(std::move(h));
}

PollResult DiskSource::poll() {
  puls::model::DiskSnapshot d;
  if (!disk_.sample(d)) return PollResult::fail(SourceStatus::Unavailable, "/proc/diskstats unreadable");
  // mount table read failures leave mounts empty; device rates still count
  (void)fs_.sample(d.mounts);
  return PollResult::ok(std::move(d));
}

PollResult NetSource::poll() {
  puls::model::NetSnapshot n;
  if (!net_.sample(n)) return PollResult::fail(SourceStatus::Unavailable, "/proc/net/dev unreadable");
  return PollResult::ok(std::move(n));
}

PollResult ProcessSource::poll() {
  puls::model::ProcessSnapshot p;
  if (!procs_.sample(p)) return PollResult::fail(SourceStatus::Error, "process scan failed");
  return PollResult::ok(std::move(p));
}

PollResult GpuSource::poll() {
  puls::model::GpuList devices;
  std::string detail;
  auto st = gpu_.poll(devices, detail);
  if (st != SourceStatus::Ok) return PollResult::fail(st, std::move(detail));
  return PollResult::ok(std::move(devices));
}

PollResult ContainerSource::poll() {
  puls::model::ContainerList list;
  std::string detail;
  auto st = containers_.poll(list, detail);
  if (st != SourceStatus::Ok) return PollResult::fail(st, std::move(detail));
  return PollResult::ok(std::move(list));
}

} // namespace puls::collectors
