#include "minitest.hpp"
#include "collectors/NetCollector.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_net() {
  auto root = fs::temp_directory_path() / fs::path("puls_test_net_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/net");
  return root;
}

static const char* kHeader =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n";

TEST(net_collector_parses_and_deltas) {
  auto root = make_root_net();
  std::ofstream(root / "proc/net/dev") << kHeader <<
    "eth0: 1000 0 0 0 0 0 0 0  2000 0 0 0 0 0 0 0\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::NetCollector c; puls::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(!s.interfaces.empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  std::ofstream(root / "proc/net/dev") << kHeader <<
    "eth0: 11000 0 0 0 0 0 0 0  32000 0 0 0 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.agg_rx_bps > 0.0 && s.agg_tx_bps > 0.0);
}

TEST(net_collector_skips_virtual_and_saturates_on_reset) {
  auto root = make_root_net();
  std::ofstream(root / "proc/net/dev") << kHeader <<
    "    lo: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n"
    "veth12ab: 100 0 0 0 0 0 0 0  100 0 0 0 0 0 0 0\n"
    "  eth0: 9000 0 0 0 0 0 0 0  9000 0 0 0 0 0 0 0\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  puls::collectors::NetCollector c; puls::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.interfaces.size(), 1u);
  ASSERT_EQ(s.interfaces[0].name, std::string("eth0"));
  // counters went backwards (interface re-created)
  std::ofstream(root / "proc/net/dev") << kHeader <<
    "  eth0: 10 0 0 0 0 0 0 0  10 0 0 0 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.agg_rx_bps, 0.0);
  ASSERT_EQ(s.agg_tx_bps, 0.0);
}

TEST(net_collector_reads_link_details) {
  auto root = make_root_net();
  std::ofstream(root / "proc/net/dev") << kHeader <<
    "  eth0: 500 7 1 0 0 0 0 0  600 9 2 0 0 0 0 0\n"
    "wlan0: 100 3 0 0 0 0 0 0  50 1 0 0 0 0 0 0\n";
  fs::create_directories(root / "sys/class/net/eth0");
  fs::create_directories(root / "sys/class/net/wlan0/wireless");
  std::ofstream(root / "sys/class/net/eth0/type") << "1\n";
  std::ofstream(root / "sys/class/net/eth0/operstate") << "up\n";
  std::ofstream(root / "sys/class/net/wlan0/type") << "1\n";
  std::ofstream(root / "sys/class/net/wlan0/operstate") << "down\n";
  std::ofstream(root / "sys/class/net/wlan0/wireless/index") << "0\n";
  setenv("PULS_PROC_ROOT", root.c_str(), 1);
  setenv("PULS_SYS_ROOT", root.c_str(), 1);
  puls::collectors::NetCollector c; puls::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.interfaces.size(), 2u);
  const auto& eth = s.interfaces[0];
  ASSERT_EQ(eth.kind, std::string("ethernet"));
  ASSERT_TRUE(eth.up);
  ASSERT_EQ(eth.rx_packets, 7u);
  ASSERT_EQ(eth.rx_errors, 1u);
  ASSERT_EQ(eth.tx_total, 600u);
  ASSERT_EQ(eth.tx_packets, 9u);
  ASSERT_EQ(eth.tx_errors, 2u);
  ASSERT_EQ(s.interfaces[1].kind, std::string("wireless"));
  ASSERT_TRUE(!s.interfaces[1].up);
  unsetenv("PULS_SYS_ROOT");
}
