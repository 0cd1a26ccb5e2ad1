#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace puls::model {

enum class GpuVendor { Nvidia, Amd, Intel };

const char* to_string(GpuVendor v);

// Normalized per-device reading. Every numeric field has a has_* flag;
// an unset flag means the value could not be read (N/A), which is
// distinct from a reading of zero.
struct GpuDevice {
  GpuVendor   vendor{GpuVendor::Nvidia};
  int         index{0};       // position within its vendor
  std::string name;
  std::string bus_id;         // PCI address or DRM card name

  bool     has_util{false};
  double   util_pct{0.0};
  bool     has_vram{false};
  uint64_t vram_used_mb{0};
  uint64_t vram_total_mb{0};
  bool     has_temp{false};
  double   temp_c{0.0};
  bool     has_power{false};
  double   power_w{0.0};
  bool     has_clock{false};
  double   clock_mhz{0.0};

  double vram_used_pct() const {
    return vram_total_mb ? 100.0 * static_cast<double>(vram_used_mb) / static_cast<double>(vram_total_mb) : 0.0;
  }
};

using GpuList = std::vector<GpuDevice>;

} // namespace puls::model
