#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ifwatch::model {

// Averaging windows reported by iftop: last 2s, 10s and 40s.
enum class Window : int { Short = 0, Medium = 1, Long = 2 };
inline constexpr size_t kWindowCount = 3;

[[nodiscard]] inline const char* window_name(size_t w) {
  switch (w) {
    case 0: return "2s";
    case 1: return "10s";
    default: return "40s";
  }
}

struct DirectionRates {
  double tx_bps{};  // sent (outbound)
  double rx_bps{};  // received (inbound)
  [[nodiscard]] double combined() const { return tx_bps + rx_bps; }
  bool operator==(const DirectionRates&) const = default;
};

using RateWindows = std::array<DirectionRates, kWindowCount>;

// sent / received / total triple used for peak and cumulative lines
struct Triple {
  double sent{};
  double received{};
  double total{};
  bool operator==(const Triple&) const = default;
};

struct Endpoint {
  std::string host;
  std::string port;   // empty when the tool printed no port
  std::string label;  // friendly name, filled by HostDirectory
  [[nodiscard]] std::string to_string() const { return port.empty() ? host : host + ":" + port; }
  bool operator==(const Endpoint&) const = default;
};

struct ConnectionRecord {
  Endpoint local;
  Endpoint remote;
  RateWindows rates{};
  double cumulative_tx_bytes{};
  double cumulative_rx_bytes{};
  std::string description{"Unknown"};
  bool operator==(const ConnectionRecord&) const = default;
};

struct InterfaceSample {
  std::string interface_id;
  RateWindows totals{};
  std::array<double, kWindowCount> combined_bps{};
  Triple peak_bps{};
  Triple cumulative_bytes{};
  std::vector<ConnectionRecord> top_connections;
  size_t connection_count{};
  std::chrono::system_clock::time_point sampled_at{};
  uint64_t seq{};  // assigned by StateStore::update
  bool operator==(const InterfaceSample&) const = default;
};

} // namespace ifwatch::model
