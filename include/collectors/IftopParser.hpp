#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Sample.hpp"

namespace ifwatch::collectors {

enum class QuantityStatus { Ok, BadUnit, Invalid };

struct Quantity {
  QuantityStatus status{QuantityStatus::Invalid};
  double bits{};  // value normalized to bits
};

// Parse an iftop figure such as "1.23Kb", "208b", "5.12KB" or "0".
// 'b' means bits, 'B' bytes; K/M/G/T are decimal prefixes.
[[nodiscard]] Quantity parse_quantity(std::string_view token);

// Split "host:port" at the last colon. No colon: port is empty.
[[nodiscard]] model::Endpoint parse_endpoint(std::string_view token);

enum class LineKind {
  Ignored,
  Connection,
  TotalSend,
  TotalReceive,
  TotalCombined,
  Peak,
  Cumulative,
  Terminator,
  BadUnit,
  Malformed,
};

enum class Direction { Out, In };  // "=>" local sent, "<=" remote received

struct ParsedLine {
  LineKind kind{LineKind::Ignored};
  Direction direction{Direction::Out};
  bool has_index{false};
  model::Endpoint endpoint;
  std::array<double, model::kWindowCount> values{};  // bits/s, or bits for Cumulative
  double cumulative_bits{};
};

// Classify one line of `iftop -t` output without any block context.
[[nodiscard]] ParsedLine classify_line(std::string_view line);

struct ParserStats {
  uint64_t blocks_emitted{};
  uint64_t blocks_discarded{};
  uint64_t lines_discarded{};
};

// Turns the periodic text blocks of `iftop -t` into InterfaceSample values.
// Lines accumulate until the "=====" terminator; a block that is malformed
// or lacks the send/receive totals is dropped as a whole.
class IftopParser {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr size_t kMaxConnectionsPerBlock = 4096;

  IftopParser(std::string interface_id, size_t display_cap, Clock clock = {});

  [[nodiscard]] std::optional<model::InterfaceSample> feed(std::string_view line);
  void reset();

  [[nodiscard]] const ParserStats& stats() const { return stats_; }
  [[nodiscard]] const std::string& interface_id() const { return interface_id_; }

private:
  struct Pending {
    model::ConnectionRecord record;
    bool have_out{false};
    bool have_in{false};
    bool discard{false};
  };

  void apply_connection(const ParsedLine& pl);
  void close_pending();
  [[nodiscard]] std::optional<model::InterfaceSample> finish_block();

  std::string interface_id_;
  size_t display_cap_;
  Clock clock_;
  ParserStats stats_{};

  // current block
  std::vector<model::ConnectionRecord> connections_;
  std::optional<Pending> pending_;
  bool malformed_{false};
  bool have_send_{false};
  bool have_receive_{false};
  bool have_combined_{false};
  model::RateWindows totals_{};
  std::array<double, model::kWindowCount> combined_{};
  model::Triple peak_{};
  model::Triple cumulative_{};
};

// Sort by descending short-window combined rate, ties by endpoint strings, then truncate.
void order_connections(std::vector<model::ConnectionRecord>& conns, size_t cap);

} // namespace ifwatch::collectors
