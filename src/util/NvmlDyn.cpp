#include "util/NvmlDyn.hpp"
#include <cstdio>
#include <cstdlib>
#include <dlfcn.h>
#include <string>
#include <vector>

namespace puls::util {

static const int NVML_SUCCESS = 0;
static const unsigned int NVML_TEMPERATURE_GPU = 0; // core sensor
static const unsigned int NVML_CLOCK_GRAPHICS = 0;

static bool log_nvml() {
  const char* v = std::getenv("PULS_LOG_NVML");
  return v && (v[0]=='1'||v[0]=='t'||v[0]=='T'||v[0]=='y'||v[0]=='Y');
}

NvmlDyn& NvmlDyn::instance() {
  static NvmlDyn inst;
  return inst;
}

bool NvmlDyn::load_once(bool disabled, const std::string& nvml_path) {
  std::lock_guard<std::mutex> lk(mu_);
  if (loaded_) return handle_ != nullptr;
  loaded_ = true;
  if (disabled) return false;

  std::vector<std::string> candidates;
  if (!nvml_path.empty()) {
    static const char* allowed_prefixes[] = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64", "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const char* prefix : allowed_prefixes) {
      if (nvml_path.starts_with(prefix)) { valid = true; break; }
    }
    if (valid) candidates.push_back(nvml_path);
    else std::fprintf(stderr, "puls: NVML: nvml_path rejected (not under a system library prefix): %s\n", nvml_path.c_str());
  }
  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");

  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_) break;
  }
  if (!handle_) {
    if (log_nvml()) std::fprintf(stderr, "puls: NVML: library not found\n");
    return false;
  }
  if (!dlsym_all()) {
    if (log_nvml()) std::fprintf(stderr, "puls: NVML: required symbols missing\n");
    ::dlclose(handle_); handle_ = nullptr; return false;
  }
  return true;
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetName = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetName");
  p_nvmlDeviceGetPciInfo_v3 = (nvmlReturn_t (*)(nvmlDevice_t, nvmlPciInfo_t*))L("nvmlDeviceGetPciInfo_v3");
  p_nvmlDeviceGetMemoryInfo = (nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*))L("nvmlDeviceGetMemoryInfo");
  p_nvmlDeviceGetTemperature = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetTemperature");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  p_nvmlDeviceGetPowerUsage = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int*))L("nvmlDeviceGetPowerUsage");
  p_nvmlDeviceGetClockInfo = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetClockInfo");
  // Core must-haves
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2;
}

bool NvmlDyn::available() const { return handle_ != nullptr; }

bool NvmlDyn::read_devices(puls::model::GpuList& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!handle_) return false;
  if (p_nvmlInit_v2() != NVML_SUCCESS) {
    if (log_nvml()) std::fprintf(stderr, "puls: NVML: init failed\n");
    return false;
  }
  // init is reference counted by the driver; pair every init with a shutdown
  struct Shutdown { nvmlReturn_t (*fn)(); ~Shutdown() { (void)fn(); } } guard{p_nvmlShutdown};

  unsigned int n = 0;
  if (p_nvmlDeviceGetCount_v2(&n) != NVML_SUCCESS) return false;

  for (unsigned int i = 0; i < n; ++i) {
    nvmlDevice_t dev{};
    if (p_nvmlDeviceGetHandleByIndex_v2(i, &dev) != NVML_SUCCESS) continue;
    puls::model::GpuDevice rec{};
    rec.vendor = puls::model::GpuVendor::Nvidia;
    rec.index = static_cast<int>(i);
    if (p_nvmlDeviceGetName) {
      char name[96]; name[0] = '\0';
      if (p_nvmlDeviceGetName(dev, name, sizeof(name)) == NVML_SUCCESS && name[0]) rec.name = name;
    }
    if (rec.name.empty()) rec.name = "NVIDIA GPU";
    if (p_nvmlDeviceGetPciInfo_v3) {
      nvmlPciInfo_t pci{};
      if (p_nvmlDeviceGetPciInfo_v3(dev, &pci) == NVML_SUCCESS) rec.bus_id = pci.busId;
    }
    if (p_nvmlDeviceGetMemoryInfo) {
      nvmlMemory_t mem{};
      if (p_nvmlDeviceGetMemoryInfo(dev, &mem) == NVML_SUCCESS && mem.total > 0) {
        rec.has_vram = true;
        rec.vram_total_mb = mem.total / (1024ull * 1024ull);
        rec.vram_used_mb = mem.used / (1024ull * 1024ull);
      }
    }
    if (p_nvmlDeviceGetTemperature) {
      unsigned int tc = 0;
      if (p_nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &tc) == NVML_SUCCESS) { rec.has_temp = true; rec.temp_c = tc; }
    }
    if (p_nvmlDeviceGetUtilizationRates) {
      nvmlUtilization_t ur{};
      if (p_nvmlDeviceGetUtilizationRates(dev, &ur) == NVML_SUCCESS) { rec.has_util = true; rec.util_pct = ur.gpu; }
    }
    if (p_nvmlDeviceGetPowerUsage) {
      unsigned int mw = 0;
      if (p_nvmlDeviceGetPowerUsage(dev, &mw) == NVML_SUCCESS) { rec.has_power = true; rec.power_w = static_cast<double>(mw) / 1000.0; }
    }
    if (p_nvmlDeviceGetClockInfo) {
      unsigned int mhz = 0;
      if (p_nvmlDeviceGetClockInfo(dev, NVML_CLOCK_GRAPHICS, &mhz) == NVML_SUCCESS) { rec.has_clock = true; rec.clock_mhz = mhz; }
    }
    out.push_back(std::move(rec));
  }
  return true;
}

} // namespace puls::util
