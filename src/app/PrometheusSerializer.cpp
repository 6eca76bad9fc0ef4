#include "app/HttpServer.hpp"
#include <charconv>
#include <cmath>
#include <algorithm>

namespace {

void append_double(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += v > 0 ? "+Inf" : "-Inf"; return; }
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// 1-label variant: name{key="val"} value
void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

// 2-label: name{k1="v1",k2="v2"} value
void emit_labeled_2d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

// 3-label: name{k1="v1",k2="v2",k3="v3"} value
void emit_labeled_3d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2,
                     const char* k3, std::string_view v3, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\",";
  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

constexpr ifwatch::model::InterfaceStatus kAllStatuses[] = {
  ifwatch::model::InterfaceStatus::Starting,
  ifwatch::model::InterfaceStatus::Running,
  ifwatch::model::InterfaceStatus::Restarting,
  ifwatch::model::InterfaceStatus::Failed,
  ifwatch::model::InterfaceStatus::ConfigError,
  ifwatch::model::InterfaceStatus::Stopped,
};

} // anonymous namespace

namespace ifwatch::app {

std::string snapshot_to_prometheus(const MetricsSnapshot& s) {
  using model::kWindowCount;
  using model::window_name;
  std::string out;
  out.reserve(4096 + s.interfaces.size() * 2048);

  // ---- Interface configuration and health ----
  emit_header(out, "ifwatch_interface_capacity_bps", "Configured link capacity in bits/sec", "gauge");
  for (const auto& st : s.interfaces)
    emit_labeled_d(out, "ifwatch_interface_capacity_bps", "interface", st.config.id, st.config.capacity_bps);

  emit_header(out, "ifwatch_interface_status", "Sampler state, 1 for the current status", "gauge");
  for (const auto& st : s.interfaces) {
    for (auto status : kAllStatuses) {
      emit_labeled_2d(out, "ifwatch_interface_status", "interface", st.config.id,
                      "status", model::status_name(status), st.health.status == status ? 1.0 : 0.0);
    }
  }

  emit_header(out, "ifwatch_interface_consecutive_failures", "Sampler failures since the last good sample", "gauge");
  for (const auto& st : s.interfaces)
    emit_labeled_u(out, "ifwatch_interface_consecutive_failures", "interface", st.config.id,
                   static_cast<uint64_t>(std::max(0, st.health.consecutive_failures)));

  // ---- Latest sample (interfaces without data are omitted) ----
  emit_header(out, "ifwatch_interface_samples_total", "Samples stored for the interface", "counter");
  for (const auto& st : s.interfaces)
    emit_labeled_u(out, "ifwatch_interface_samples_total", "interface", st.config.id, st.samples);

  emit_header(out, "ifwatch_interface_rate_bps", "Averaged rate in bits/sec by direction and window", "gauge");
  for (const auto& st : s.interfaces) {
    if (!st.sample) continue;
    for (size_t w = 0; w < kWindowCount; ++w) {
      const char* win = window_name(w);
      emit_labeled_3d(out, "ifwatch_interface_rate_bps", "interface", st.config.id, "direction", "tx", "window", win,
                      st.sample->totals[w].tx_bps);
      emit_labeled_3d(out, "ifwatch_interface_rate_bps", "interface", st.config.id, "direction", "rx", "window", win,
                      st.sample->totals[w].rx_bps);
      emit_labeled_3d(out, "ifwatch_interface_rate_bps", "interface", st.config.id, "direction", "total", "window", win,
                      st.sample->combined_bps[w]);
    }
  }

  emit_header(out, "ifwatch_interface_peak_bps", "Peak rate in bits/sec since the sampler started", "gauge");
  for (const auto& st : s.interfaces) {
    if (!st.sample) continue;
    emit_labeled_2d(out, "ifwatch_interface_peak_bps", "interface", st.config.id, "direction", "tx", st.sample->peak_bps.sent);
    emit_labeled_2d(out, "ifwatch_interface_peak_bps", "interface", st.config.id, "direction", "rx", st.sample->peak_bps.received);
    emit_labeled_2d(out, "ifwatch_interface_peak_bps", "interface", st.config.id, "direction", "total", st.sample->peak_bps.total);
  }

  emit_header(out, "ifwatch_interface_cumulative_bytes", "Bytes transferred since the sampler started", "gauge");
  for (const auto& st : s.interfaces) {
    if (!st.sample) continue;
    emit_labeled_2d(out, "ifwatch_interface_cumulative_bytes", "interface", st.config.id, "direction", "tx", st.sample->cumulative_bytes.sent);
    emit_labeled_2d(out, "ifwatch_interface_cumulative_bytes", "interface", st.config.id, "direction", "rx", st.sample->cumulative_bytes.received);
    emit_labeled_2d(out, "ifwatch_interface_cumulative_bytes", "interface", st.config.id, "direction", "total", st.sample->cumulative_bytes.total);
  }

  emit_header(out, "ifwatch_interface_utilization_ratio", "Short-window combined rate over capacity", "gauge");
  for (const auto& st : s.interfaces) {
    if (!st.sample || !(st.config.capacity_bps > 0.0)) continue;
    emit_labeled_d(out, "ifwatch_interface_utilization_ratio", "interface", st.config.id,
                   st.sample->combined_bps[0] / st.config.capacity_bps);
  }

  emit_header(out, "ifwatch_interface_connections", "Connections seen in the latest block", "gauge");
  for (const auto& st : s.interfaces) {
    if (!st.sample) continue;
    emit_labeled_u(out, "ifwatch_interface_connections", "interface", st.config.id, st.sample->connection_count);
  }

  // ---- Clients ----
  emit_header(out, "ifwatch_clients_connected", "Live WebSocket sessions", "gauge");
  emit_gauge_u(out, "ifwatch_clients_connected", s.clients.live_sessions);
  emit_header(out, "ifwatch_clients_total", "WebSocket sessions accepted since start", "counter");
  emit_gauge_u(out, "ifwatch_clients_total", s.clients.sessions_total);
  emit_header(out, "ifwatch_messages_broadcast_total", "Messages fanned out to sessions", "counter");
  emit_gauge_u(out, "ifwatch_messages_broadcast_total", s.clients.messages_broadcast);
  emit_header(out, "ifwatch_messages_dropped_total", "Queued messages replaced before delivery", "counter");
  emit_gauge_u(out, "ifwatch_messages_dropped_total", s.clients.messages_dropped);

  return out;
}

} // namespace ifwatch::app
