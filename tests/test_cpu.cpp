#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_cpu() {
  auto root = fs::temp_directory_path() / fs::path("puls_test_cpu_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu();
  // First sample
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 100 0 100 1000 0 0 0 0\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::CpuCollector c; puls::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.usage_pct, 0.0);
  // Second sample with more work and total
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                        "cpu0 150 0 150 1100 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.usage_pct > 40.0 && s.usage_pct < 60.0);
}

TEST(cpu_collector_per_core_and_model) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/cpuinfo") << "processor\t: 0\nmodel name\t: Mock CPU 9000\n\n"
                                          "processor\t: 1\nmodel name\t: Mock CPU 9000\n";
  std::ofstream(root / "proc/stat") << "cpu  200 0 0 200 0 0 0 0\n"
                                        "cpu0 100 0 0 100 0 0 0 0\n"
                                        "cpu1 100 0 0 100 0 0 0 0\n"
                                        "intr 12345\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::CpuCollector c; puls::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  std::ofstream(root / "proc/stat") << "cpu  300 0 0 300 0 0 0 0\n"
                                        "cpu0 200 0 0 100 0 0 0 0\n"   // fully busy
                                        "cpu1 100 0 0 200 0 0 0 0\n"   // idle
                                        "intr 12345\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.per_core_pct.size(), 2u);
  ASSERT_TRUE(s.per_core_pct[0] > 99.0);
  ASSERT_TRUE(s.per_core_pct[1] < 1.0);
  ASSERT_EQ(s.logical_threads, 2);
  ASSERT_EQ(s.model, std::string("Mock CPU 9000"));
}

TEST(cpu_collector_rejects_missing_aggregate_line) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "intr 1\nctxt 2\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::CpuCollector c; puls::model::CpuSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
}
