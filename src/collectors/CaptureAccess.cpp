#include "collectors/CaptureAccess.hpp"
#include "util/Procfs.hpp"

#include <net/if.h>
#include <unistd.h>

#include <cctype>
#include <charconv>
#include <cstdint>

namespace ifwatch::collectors {

bool status_has_net_raw(std::string_view status_text) {
  constexpr std::string_view key = "CapEff:";
  size_t pos = 0;
  while (pos < status_text.size()) {
    auto eol = status_text.find('\n', pos);
    if (eol == std::string_view::npos) eol = status_text.size();
    auto line = status_text.substr(pos, eol - pos);
    pos = eol + 1;
    if (!line.starts_with(key)) continue;
    line.remove_prefix(key.size());
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
    uint64_t caps = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), caps, 16);
    if (ec != std::errc{} || ptr != line.data() + line.size()) return false;
    return (caps >> kCapNetRaw) & 1u;
  }
  return false;
}

bool has_capture_privilege() {
  if (::geteuid() == 0) return true;
  auto status = ifwatch::util::read_file_string("/proc/self/status");
  return status && status_has_net_raw(*status);
}

bool valid_interface_name(std::string_view id) {
  if (id.empty() || id.size() >= IFNAMSIZ) return false;
  if (id == "." || id == "..") return false;
  for (char c : id) {
    if (c == '/' || c == ':' || std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool interface_present(const std::string& id) {
  if (!valid_interface_name(id)) return false;
  return ifwatch::util::path_exists("/sys/class/net/" + id);
}

} // namespace ifwatch::collectors
