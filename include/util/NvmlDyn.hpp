#pragma once
#include <mutex>
#include <string>
#include "model/Gpu.hpp"

namespace puls::util {

// Lightweight runtime NVML loader (dlopen/dlsym).
// Avoids a build-time dependency on nvml.h and degrades gracefully on
// machines without the NVIDIA driver.
class NvmlDyn {
public:
  static NvmlDyn& instance();

  // Attempt to load libnvidia-ml once (idempotent). nvml_path must live
  // under a system library prefix to be honored.
  bool load_once(bool disabled, const std::string& nvml_path);

  // True if library is loaded and core symbols are present.
  bool available() const;

  // Append one GpuDevice per NVML device. Returns false if NVML is not
  // usable; per-field failures only clear that field's has_* flag.
  bool read_devices(puls::model::GpuList& out);

private:
  NvmlDyn() = default;
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  std::mutex mu_;
  void* handle_{};
  bool loaded_{false};

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlMemory_t { unsigned long long total, free, used; };
  struct nvmlUtilization_t { unsigned int gpu, memory; };
  struct nvmlPciInfo_t {
    char busIdLegacy[16];
    unsigned int domain, bus, device, pciDeviceId, pciSubSystemId;
    char busId[32];
  };

  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetName)(nvmlDevice_t device, char* name, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetPciInfo_v3)(nvmlDevice_t device, nvmlPciInfo_t* pci){};
  nvmlReturn_t (*p_nvmlDeviceGetMemoryInfo)(nvmlDevice_t device, nvmlMemory_t* mem){};
  nvmlReturn_t (*p_nvmlDeviceGetTemperature)(nvmlDevice_t device, unsigned int sensorType, unsigned int* temp){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};
  nvmlReturn_t (*p_nvmlDeviceGetPowerUsage)(nvmlDevice_t device, unsigned int* milliwatts){};
  nvmlReturn_t (*p_nvmlDeviceGetClockInfo)(nvmlDevice_t device, unsigned int type, unsigned int* mhz){};

  bool dlsym_all();
};

} // namespace puls::util
