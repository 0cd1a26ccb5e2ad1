#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "model/Gpu.hpp"
#include "model/Snapshot.hpp"
#include "util/Command.hpp"

namespace puls::collectors {

struct GpuOptions {
  bool disable_nvml{false};
  std::string nvml_path;          // explicit libnvidia-ml location
  std::string smi_path{"auto"};   // "auto" searches PATH; empty disables nvidia-smi
};

// NVML first, then nvidia-smi CSV, then /proc/driver/nvidia.
class NvidiaGpuSource {
public:
  explicit NvidiaGpuSource(GpuOptions opts);
  puls::model::SourceStatus poll(puls::model::GpuList& out, std::string& detail);

  // Parse `nvidia-smi --query-gpu=... --format=csv,noheader,nounits` output.
  static bool parse_smi_csv(const std::string& text, puls::model::GpuList& out);

private:
  bool read_smi(puls::model::GpuList& out, std::string& detail);
  GpuOptions opts_;
  std::unique_ptr<puls::util::CommandRunner> runner_;
};

// amdgpu via DRM sysfs (PCI vendor 0x1002).
class AmdGpuSource {
public:
  puls::model::SourceStatus poll(puls::model::GpuList& out, std::string& detail);
};

// i915/xe via DRM sysfs (PCI vendor 0x8086). The kernel exposes no busy
// percentage, so utilization stays N/A.
class IntelGpuSource {
public:
  puls::model::SourceStatus poll(puls::model::GpuList& out, std::string& detail);
};

using GpuBackend = std::variant<NvidiaGpuSource, AmdGpuSource, IntelGpuSource>;

// Enumerates every vendor on each call; no device list is kept between
// calls so hot-plugged or removed devices show up on the next poll.
class GpuCollector {
public:
  explicit GpuCollector(GpuOptions opts = {});
  puls::model::SourceStatus poll(puls::model::GpuList& out, std::string& detail);
  bool sample(puls::model::GpuList& out);
private:
  std::vector<GpuBackend> backends_;
};

} // namespace puls::collectors
