#pragma once
#include "collectors/IMetricSource.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/ThermalCollector.hpp"
#include "collectors/HostInfoCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/ContainerCollector.hpp"

namespace puls::collectors {

// CPU, memory, swap, load average, uptime and CPU temperature.
class HostSource : public IMetricSource {
public:
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Host; }
  const char* name() const override { return "host"; }
private:
  CpuCollector cpu_{};
  MemoryCollector mem_{};
  ThermalCollector thermal_{};
  HostInfoCollector info_{};
};

// Block device I/O plus filesystem usage.
class DiskSource : public IMetricSource {
public:
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Disk; }
  const char* name() const override { return "disk"; }
private:
  DiskCollector disk_{};
  FsCollector fs_{};
};

class NetSource : public IMetricSource {
public:
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Net; }
  const char* name() const override { return "network"; }
private:
  NetCollector net_{};
};

class ProcessSource : public IMetricSource {
public:
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Process; }
  const char* name() const override { return "process"; }
private:
  ProcessCollector procs_{};
};

class GpuSource : public IMetricSource {
public:
  explicit GpuSource(GpuOptions opts = {}) : gpu_(std::move(opts)) {}
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Gpu; }
  const char* name() const override { return "gpu"; }
private:
  GpuCollector gpu_;
};

class ContainerSource : public IMetricSource {
public:
  explicit ContainerSource(ContainerOptions opts = {}) : containers_(std::move(opts)) {}
  PollResult poll() override;
  puls::model::SourceKind kind() const override { return puls::model::SourceKind::Container; }
  const char* name() const override { return "container"; }
private:
  ContainerCollector containers_;
};

} // namespace puls::collectors
