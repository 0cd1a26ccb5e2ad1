#include "minitest.hpp"
#include "collectors/ProcessCollector.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_proc() {
  auto root = fs::temp_directory_path() / fs::path("puls_test_proc_") / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/100");
  std::ofstream(root / "proc/meminfo") << "MemTotal: 4194304 kB\n";
  std::ofstream(root / "proc/100/status") << "Name:\tmy proc\nState:\tS (sleeping)\nUid:\t0\t0\t0\t0\n";
  {
    std::ofstream cmd(root / "proc/100/cmdline", std::ios::binary);
    cmd.write("/usr/bin/my\0--flag\0", 19);
  }
  return root;
}

static void write_stat(const fs::path& root, uint64_t cpu_total, uint64_t utime, uint64_t starttime) {
  // two cores; the aggregate line sums to cpu_total
  std::ofstream(root / "proc/stat") << "cpu  " << cpu_total << " 0 0 0 0 0 0 0\n"
                                        "cpu0 0 0 0 0 0 0 0 0\n"
                                        "cpu1 0 0 0 0 0 0 0 0\n"
                                        "btime 1700000000\n";
  std::ofstream(root / "proc/100/stat") << "100 (my proc) S 1 100 100 0 -1 4194304 10 0 0 0 "
                                        << utime << " 0 0 0 20 0 3 0 " << starttime << " 1048576 256 18446744073709551615\n";
}

static void write_io(const fs::path& root, uint64_t rd, uint64_t wr) {
  std::ofstream(root / "proc/100/io") << "rchar: 1\nwchar: 1\nread_bytes: " << rd << "\nwrite_bytes: " << wr << "\n";
}

TEST(process_collector_cpu_delta_is_per_core_scaled) {
  auto root = make_root_proc();
  write_stat(root, 10000, 50, 500);
  write_io(root, 0, 0);
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::ProcessCollector c;
  puls::model::ProcessSnapshot s;
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.processes.size(), 1u);
  ASSERT_EQ(s.processes[0].cpu_pct, 0.0);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  write_stat(root, 11000, 150, 500);
  write_io(root, 4096, 8192);
  ASSERT_TRUE(c.sample(s));
  const auto& p = s.processes[0];
  // 100 of 1000 jiffies on a 2-core machine
  ASSERT_TRUE(p.cpu_pct > 19.9 && p.cpu_pct < 20.1);
  ASSERT_EQ(p.name, std::string("my proc"));
  ASSERT_EQ(p.cmd, std::string("/usr/bin/my --flag"));
  ASSERT_EQ(p.ppid, 1);
  ASSERT_EQ(p.threads, 3);
  ASSERT_EQ(p.state, 'S');
  ASSERT_TRUE(p.has_io);
  ASSERT_TRUE(p.io_read_bps > 0.0 && p.io_write_bps > 0.0);
  ASSERT_TRUE(p.mem_pct > 0.0);
  ASSERT_TRUE(!p.user_name.empty());
  ASSERT_EQ(s.cpu_count, 2u);
  ASSERT_EQ(s.state_sleeping, 1u);
}

TEST(process_collector_reused_pid_gets_no_delta) {
  auto root = make_root_proc();
  write_stat(root, 10000, 50, 500);
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::ProcessCollector c;
  puls::model::ProcessSnapshot s;
  ASSERT_TRUE(c.sample(s));
  // same pid, different start time: a new process
  write_stat(root, 11000, 60, 900);
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.processes[0].cpu_pct, 0.0);
  ASSERT_TRUE(!s.processes[0].has_io);
}

TEST(process_collector_system_name_prefixes) {
  ASSERT_TRUE(puls::collectors::ProcessCollector::is_system_process("kworker/0:1"));
  ASSERT_TRUE(puls::collectors::ProcessCollector::is_system_process("systemd-journald"));
  ASSERT_TRUE(puls::collectors::ProcessCollector::is_system_process("[kthreadd]"));
  ASSERT_TRUE(!puls::collectors::ProcessCollector::is_system_process("firefox"));
  ASSERT_TRUE(!puls::collectors::ProcessCollector::is_system_process("bash"));
}
