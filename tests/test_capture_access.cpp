#include "minitest.hpp"
#include "collectors/CaptureAccess.hpp"
#include "util/Procfs.hpp"
#include <unistd.h>
#include <cstdlib>
#include <filesystem>

using namespace ifwatch::collectors;

TEST(capability_mask_detects_net_raw) {
  ASSERT_TRUE(status_has_net_raw("Name:\tiftop\nCapEff:\t0000000000002000\n"));
  ASSERT_TRUE(status_has_net_raw("CapEff:\t000001ffffffffff\n"));
  ASSERT_FALSE(status_has_net_raw("CapEff:\t0000000000001000\n"));
  ASSERT_FALSE(status_has_net_raw("CapInh:\t0000000000002000\nCapEff:\t0000000000000000\n"));
  ASSERT_FALSE(status_has_net_raw("Name:\tbash\n"));
  ASSERT_FALSE(status_has_net_raw("CapEff:\tnothex\n"));
}

TEST(interface_names_follow_ifnamsiz_rules) {
  ASSERT_TRUE(valid_interface_name("eth0"));
  ASSERT_TRUE(valid_interface_name("wlp3s0"));
  ASSERT_TRUE(valid_interface_name("br-lan.10"));
  ASSERT_FALSE(valid_interface_name(""));
  ASSERT_FALSE(valid_interface_name(".."));
  ASSERT_FALSE(valid_interface_name("eth0/1"));
  ASSERT_FALSE(valid_interface_name("eth0:1"));
  ASSERT_FALSE(valid_interface_name("eth 0"));
  ASSERT_FALSE(valid_interface_name("abcdefghijklmnop"));  // 16 chars
}

TEST(interface_presence_uses_sys_root) {
  auto root = std::filesystem::temp_directory_path() / ("ifwatch_sysroot_" + std::to_string(::getpid()));
  std::filesystem::create_directories(root / "sys" / "class" / "net" / "eth7");
  ::setenv("IFWATCH_SYS_ROOT", root.c_str(), 1);
  bool eth7 = interface_present("eth7");
  bool eth8 = interface_present("eth8");
  bool bad = interface_present("../eth7");
  ::unsetenv("IFWATCH_SYS_ROOT");
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  ASSERT_TRUE(eth7);
  ASSERT_FALSE(eth8);
  ASSERT_FALSE(bad);
}

TEST(procfs_remap_only_touches_matching_prefix) {
  ::setenv("IFWATCH_PROC_ROOT", "/tmp/fakeproc", 1);
  auto mapped = ifwatch::util::map_proc_path("/proc/self/status");
  auto untouched = ifwatch::util::map_proc_path("/etc/ethers");
  ::unsetenv("IFWATCH_PROC_ROOT");
  ASSERT_EQ(mapped, "/tmp/fakeproc/proc/self/status");
  ASSERT_EQ(untouched, "/etc/ethers");
  ASSERT_EQ(ifwatch::util::map_proc_path("/proc/self/status"), "/proc/self/status");
}
