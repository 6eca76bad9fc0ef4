#pragma once
#include <string>

namespace ifwatch::model {

struct InterfaceConfig {
  std::string id;
  double capacity_bps{};
  std::string config_error;  // non-empty: entry is malformed, never monitored
};

enum class InterfaceStatus { Starting, Running, Restarting, Failed, ConfigError, Stopped };

[[nodiscard]] inline const char* status_name(InterfaceStatus s) {
  switch (s) {
    case InterfaceStatus::Starting: return "starting";
    case InterfaceStatus::Running: return "running";
    case InterfaceStatus::Restarting: return "restarting";
    case InterfaceStatus::Failed: return "failed";
    case InterfaceStatus::ConfigError: return "config_error";
    case InterfaceStatus::Stopped: return "stopped";
  }
  return "unknown";
}

struct InterfaceHealth {
  InterfaceStatus status{InterfaceStatus::Starting};
  int consecutive_failures{};
  std::string message;
};

} // namespace ifwatch::model
