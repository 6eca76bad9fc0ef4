#pragma once
#include <string>
#include <string_view>

namespace ifwatch::collectors {

// Linux capability number of CAP_NET_RAW
inline constexpr int kCapNetRaw = 13;

// Parse the CapEff line of /proc/<pid>/status and test CAP_NET_RAW.
[[nodiscard]] bool status_has_net_raw(std::string_view status_text);

// Root, or CAP_NET_RAW in the effective set of this process.
[[nodiscard]] bool has_capture_privilege();

// Syntactic check against IFNAMSIZ rules.
[[nodiscard]] bool valid_interface_name(std::string_view id);

// Interface exists under /sys/class/net.
[[nodiscard]] bool interface_present(const std::string& id);

} // namespace ifwatch::collectors
