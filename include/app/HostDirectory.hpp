#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include "model/Sample.hpp"

namespace ifwatch::app {

struct HostDirectoryOptions {
  bool enabled{true};
  std::string ethers_path{"/usr/local/etc/ethers"};
  std::string lease_command{"dhcp-lease-list"};
};

// Friendly names for LAN addresses plus well-known port descriptions.
// Labels come from the ethers file (MAC -> name) joined with the DHCP lease
// listing (MAC -> IP -> hostname); an ethers name beats the lease hostname.
class HostDirectory {
public:
  HostDirectory() = default;
  explicit HostDirectory(HostDirectoryOptions opts) : opts_(std::move(opts)) {}

  // Re-reads both sources. Missing sources leave the directory empty, never fail.
  void refresh();

  // Parse helpers; exposed so sources can be fed from tests.
  void load_ethers_text(std::string_view text);
  void load_lease_text(std::string_view text);
  void clear();

  [[nodiscard]] std::string label_for(std::string_view ip) const;
  void annotate(model::ConnectionRecord& conn) const;
  [[nodiscard]] size_t size() const { return labels_.size(); }

private:
  HostDirectoryOptions opts_;
  std::unordered_map<std::string, std::string> ethers_;  // lowercase mac -> name
  std::unordered_map<std::string, std::string> labels_;  // ip -> label
};

// "SSH", "HTTPS", ... for well-known ports; "Unknown" otherwise.
[[nodiscard]] std::string describe_ports(std::string_view local_port, std::string_view remote_port);

} // namespace ifwatch::app
