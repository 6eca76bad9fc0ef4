#include "app/HostDirectory.hpp"
#include "util/Procfs.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <vector>

namespace ifwatch::app {

namespace {

struct PortName { unsigned port; const char* name; };

// Later entries win when both endpoints match.
constexpr PortName kWellKnownPorts[] = {
  {22, "SSH"},
  {80, "HTTP"},
  {143, "IMAP"},
  {443, "HTTPS"},
  {16393, "FaceTime"},
  {25565, "MineCraft"},
};

std::vector<std::string_view> split_ws(std::string_view line) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    size_t start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > start) out.push_back(line.substr(start, i - start));
  }
  return out;
}

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool is_ip_address(std::string_view s) {
  std::string z(s);
  unsigned char buf[16];
  return ::inet_pton(AF_INET, z.c_str(), buf) == 1 || ::inet_pton(AF_INET6, z.c_str(), buf) == 1;
}

template <typename F>
void for_each_line(std::string_view text, F&& fn) {
  while (!text.empty()) {
    auto nl = text.find('\n');
    fn(text.substr(0, nl));
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }
}

unsigned parse_port(std::string_view s) {
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return 0;
  return v;
}

} // namespace

std::string describe_ports(std::string_view local_port, std::string_view remote_port) {
  unsigned a = parse_port(local_port);
  unsigned b = parse_port(remote_port);
  const char* desc = "Unknown";
  for (const auto& p : kWellKnownPorts) {
    if (a == p.port || b == p.port) desc = p.name;
  }
  return desc;
}

void HostDirectory::clear() {
  ethers_.clear();
  labels_.clear();
}

void HostDirectory::load_ethers_text(std::string_view text) {
  for_each_line(text, [&](std::string_view line) {
    auto hash = line.find('#');
    if (hash != std::string_view::npos) line = line.substr(0, hash);
    auto cols = split_ws(line);
    if (cols.size() < 2) return;
    ethers_[lower(cols[0])] = std::string(cols[1]);
  });
}

void HostDirectory::load_lease_text(std::string_view text) {
  for_each_line(text, [&](std::string_view line) {
    auto cols = split_ws(line);
    if (cols.size() < 3) return;
    if (!is_ip_address(cols[1])) return;  // header and separator rows
    auto it = ethers_.find(lower(cols[0]));
    labels_[std::string(cols[1])] = it != ethers_.end() ? it->second : std::string(cols[2]);
  });
}

void HostDirectory::refresh() {
  clear();
  if (!opts_.enabled) return;

  if (!opts_.ethers_path.empty()) {
    if (auto text = util::read_file_string(opts_.ethers_path)) load_ethers_text(*text);
  }
  if (opts_.lease_command.empty()) return;

  std::string cmd = opts_.lease_command + " 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    std::fprintf(stderr, "ifwatch: host directory: cannot run '%s'\n", opts_.lease_command.c_str());
    return;
  }
  std::string out;
  char buf[512];
  while (std::fgets(buf, sizeof(buf), fp)) out += buf;
  int rc = ::pclose(fp);
  // a missing lease tool (shell status 127) is normal on hosts without a DHCP server
  if (rc != 0 && out.empty()) return;
  load_lease_text(out);
}

std::string HostDirectory::label_for(std::string_view ip) const {
  auto it = labels_.find(std::string(ip));
  return it == labels_.end() ? std::string() : it->second;
}

void HostDirectory::annotate(model::ConnectionRecord& conn) const {
  conn.local.label = label_for(conn.local.host);
  conn.remote.label = label_for(conn.remote.host);
  conn.description = describe_ports(conn.local.port, conn.remote.port);
}

} // namespace ifwatch::app
