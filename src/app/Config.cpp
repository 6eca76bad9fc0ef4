#include "app/Config.hpp"
#include "collectors/CaptureAccess.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <cstdlib>
#include <filesystem>

namespace ifwatch::app {

static constexpr std::string_view kInterfacePrefix = "interface.";

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("IFWATCH_", 0) == 0) {
    alt = std::string("ifwatch_") + n.substr(8);
  } else if (n.rfind("ifwatch_", 0) == 0) {
    alt = std::string("IFWATCH_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int out = defv;
  std::string_view sv(v);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("IFWATCH_CONFIG")) return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ifwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/ifwatch/config.toml";
  return {};
}

std::vector<std::string> split_args(std::string_view s) {
  std::vector<std::string> out;
  std::string cur;
  bool in_word = false, quoted = false;
  for (char c : s) {
    if (c == '"') { quoted = !quoted; in_word = true; continue; }
    if (!quoted && (c == ' ' || c == '\t')) {
      if (in_word) { out.push_back(std::move(cur)); cur.clear(); in_word = false; }
      continue;
    }
    cur += c;
    in_word = true;
  }
  if (in_word) out.push_back(std::move(cur));
  return out;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static model::InterfaceConfig make_interface(std::string id, bool have_capacity, double capacity) {
  model::InterfaceConfig ic;
  ic.id = std::move(id);
  ic.capacity_bps = capacity;
  if (!collectors::valid_interface_name(ic.id)) ic.config_error = "invalid interface name";
  else if (!have_capacity) ic.config_error = "capacity_bps missing or not a number";
  else if (!(capacity > 0.0) || !std::isfinite(capacity)) ic.config_error = "capacity_bps must be a positive number";
  return ic;
}

static void parse_env_interfaces(std::string_view list, std::vector<model::InterfaceConfig>& out) {
  while (!list.empty()) {
    auto comma = list.find(',');
    std::string_view item = list.substr(0, comma);
    list = (comma == std::string_view::npos) ? std::string_view{} : list.substr(comma + 1);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    if (item.empty()) continue;
    auto eq = item.find('=');
    std::string id(item.substr(0, eq));
    double cap = 0.0;
    bool have = false;
    if (eq != std::string_view::npos) {
      auto num = item.substr(eq + 1);
      auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), cap);
      have = ec == std::errc{} && ptr == num.data() + num.size();
    }
    out.push_back(make_interface(std::move(id), have, cap));
  }
}

bool resolve_config(const util::TomlReader& toml, bool have_toml, Config& out, std::string& error) {
  Config c;
  c.source = out.source;

  c.server.bind = resolve_string(toml, have_toml, "server", "bind", "IFWATCH_BIND", c.server.bind);
  int port = resolve_int(toml, have_toml, "server", "port", "IFWATCH_PORT", c.server.port);
  if (port < 1 || port > 65535) { error = "server.port out of range"; return false; }
  c.server.port = static_cast<uint16_t>(port);
  c.server.path = resolve_string(toml, have_toml, "server", "path", "IFWATCH_WS_PATH", c.server.path);
  if (c.server.path.empty() || c.server.path.front() != '/') { error = "server.path must start with '/'"; return false; }
  int depth = resolve_int(toml, have_toml, "server", "queue_depth", "IFWATCH_QUEUE_DEPTH", static_cast<int>(c.server.queue_depth));
  if (depth < 1) { error = "server.queue_depth must be at least 1"; return false; }
  c.server.queue_depth = static_cast<size_t>(depth);

  auto& s = c.sampler;
  s.command = resolve_string(toml, have_toml, "sampler", "command", "IFWATCH_SAMPLER", s.command);
  if (s.command.empty()) { error = "sampler.command is empty"; return false; }
  if (have_toml && toml.has("sampler", "args")) s.args = split_args(toml.get_string("sampler", "args"));
  else if (const char* a = getenv_compat("IFWATCH_SAMPLER_ARGS")) s.args = split_args(a);
  int cap = resolve_int(toml, have_toml, "sampler", "display_cap", "IFWATCH_DISPLAY_CAP", static_cast<int>(s.display_cap));
  if (cap < 1) { error = "sampler.display_cap must be at least 1"; return false; }
  s.display_cap = static_cast<size_t>(cap);
  s.max_failures = resolve_int(toml, have_toml, "sampler", "max_failures", "IFWATCH_MAX_FAILURES", s.max_failures);
  if (s.max_failures < 1) { error = "sampler.max_failures must be at least 1"; return false; }
  int initial = resolve_int(toml, have_toml, "sampler", "backoff_initial_ms", "IFWATCH_BACKOFF_INITIAL_MS",
                            static_cast<int>(s.backoff_initial.count()));
  int maxd = resolve_int(toml, have_toml, "sampler", "backoff_max_ms", "IFWATCH_BACKOFF_MAX_MS",
                         static_cast<int>(s.backoff_max.count()));
  if (initial < 1 || maxd < initial) { error = "sampler backoff must satisfy 1 <= initial <= max"; return false; }
  s.backoff_initial = std::chrono::milliseconds(initial);
  s.backoff_max = std::chrono::milliseconds(maxd);
  s.require_privilege = resolve_bool(toml, have_toml, "sampler", "require_privilege", "IFWATCH_REQUIRE_PRIVILEGE", s.require_privilege);
  s.verify_interface = resolve_bool(toml, have_toml, "sampler", "verify_interface", "IFWATCH_VERIFY_INTERFACE", s.verify_interface);

  s.hosts.enabled = resolve_bool(toml, have_toml, "hosts", "enabled", "IFWATCH_HOSTS", s.hosts.enabled);
  s.hosts.ethers_path = resolve_string(toml, have_toml, "hosts", "ethers", "IFWATCH_ETHERS", s.hosts.ethers_path);
  s.hosts.lease_command = resolve_string(toml, have_toml, "hosts", "lease_command", "IFWATCH_LEASE_COMMAND", s.hosts.lease_command);

  if (have_toml) {
    for (const auto& name : toml.section_names()) {
      if (!name.starts_with(kInterfacePrefix)) continue;
      std::string id = name.substr(kInterfacePrefix.size());
      if (id.size() >= 2 && id.front() == '"' && id.back() == '"') id = id.substr(1, id.size() - 2);
      double cap_bps = toml.get_double(name, "capacity_bps", std::numeric_limits<double>::quiet_NaN());
      c.interfaces.push_back(make_interface(std::move(id), !std::isnan(cap_bps), cap_bps));
    }
  }
  if (c.interfaces.empty()) {
    if (const char* env = getenv_compat("IFWATCH_INTERFACES")) parse_env_interfaces(env, c.interfaces);
  }
  if (c.interfaces.empty()) { error = "no interfaces configured"; return false; }

  out = std::move(c);
  return true;
}

bool load_config(const std::string& path, Config& out, std::string& error) {
  std::string file = path.empty() ? config_file_path() : path;
  util::TomlReader toml;
  bool have_toml = false;
  if (!file.empty()) {
    std::error_code ec;
    bool exists = std::filesystem::exists(file, ec);
    if (exists) {
      if (!toml.load(file)) { error = "cannot read " + file; return false; }
      have_toml = true;
    } else if (!path.empty()) {
      error = "config file not found: " + file;
      return false;
    }
  }
  out.source = have_toml ? file : std::string();
  return resolve_config(toml, have_toml, out, error);
}

std::string describe_config(const Config& cfg) {
  std::string out;
  out += "config: " + (cfg.source.empty() ? std::string("(defaults and environment)") : cfg.source) + "\n";
  out += "server: " + cfg.server.bind + ":" + std::to_string(cfg.server.port) + cfg.server.path +
         " queue_depth=" + std::to_string(cfg.server.queue_depth) + "\n";
  out += "sampler:";
  for (const auto& a : build_argv(cfg.sampler.command, cfg.sampler.args, "{interface}")) out += " " + a;
  out += "\n  display_cap=" + std::to_string(cfg.sampler.display_cap) +
         " max_failures=" + std::to_string(cfg.sampler.max_failures) +
         " backoff=" + std::to_string(cfg.sampler.backoff_initial.count()) + ".." +
         std::to_string(cfg.sampler.backoff_max.count()) + "ms\n";
  out += "hosts: " + std::string(cfg.sampler.hosts.enabled ? "enabled" : "disabled") + "\n";
  for (const auto& ic : cfg.interfaces) {
    out += "interface " + ic.id + ": capacity_bps=" + std::to_string(static_cast<long long>(ic.capacity_bps));
    if (!ic.config_error.empty()) out += " ERROR: " + ic.config_error;
    out += "\n";
  }
  return out;
}

} // namespace ifwatch::app
