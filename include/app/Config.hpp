#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "app/InterfaceMonitor.hpp"
#include "model/Interface.hpp"
#include "util/TomlReader.hpp"

namespace ifwatch::app {

struct ServerConfig {
  std::string bind{"0.0.0.0"};
  uint16_t port{8766};
  std::string path{"/"};
  size_t queue_depth{16};
};

struct Config {
  ServerConfig server;
  MonitorOptions sampler;
  std::vector<model::InterfaceConfig> interfaces;
  std::string source;  // config file used; empty when running on env/defaults
};

// IFWATCH_CONFIG, else $XDG_CONFIG_HOME/ifwatch/config.toml, else ~/.config/ifwatch/config.toml
[[nodiscard]] std::string config_file_path();

// IFWATCH_FOO, falling back to ifwatch_foo
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// Whitespace split; "double quoted" words may contain spaces.
[[nodiscard]] std::vector<std::string> split_args(std::string_view s);

// Resolve every value TOML -> environment -> default. Interfaces come from
// [interface.<id>] sections, or IFWATCH_INTERFACES="eth0=500000000,eth1=...".
// A malformed interface entry only marks that entry (config_error); false is
// returned for problems that make the whole daemon unusable.
[[nodiscard]] bool resolve_config(const util::TomlReader& toml, bool have_toml, Config& out, std::string& error);

// Loads path (empty: config_file_path(), missing default file is not an error).
[[nodiscard]] bool load_config(const std::string& path, Config& out, std::string& error);

// Human-readable dump for --check-config
[[nodiscard]] std::string describe_config(const Config& cfg);

} // namespace ifwatch::app
