#include "app/WireFormat.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>

namespace {

using ifwatch::model::kWindowCount;

void append_double(std::string& out, double v) {
  if (!std::isfinite(v)) { out += '0'; return; }
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

void append_int(std::string& out, int64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

// Length of the well-formed UTF-8 sequence starting at sv[i], 0 if none.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t utf8_sequence_length(std::string_view sv, size_t i) {
  auto byte = [&](size_t k) { return static_cast<unsigned char>(sv[k]); };
  unsigned char b0 = byte(i);
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) len = 2;
  else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) lo = 0xA0;
    else if (b0 == 0xED) hi = 0x9F;
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) lo = 0x90;
    else if (b0 == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (i + len > sv.size()) return 0;
  if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
  for (size_t k = 2; k < len; ++k) {
    if ((byte(i + k) & 0xC0) != 0x80) return 0;
  }
  return len;
}

// Sampler stderr and host names are arbitrary bytes: anything that is not
// valid UTF-8 becomes U+FFFD so the message stays parseable JSON.
void append_string(std::string& out, std::string_view sv) {
  out += '"';
  for (size_t i = 0; i < sv.size();) {
    char c = sv[i];
    auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) {
      size_t len = utf8_sequence_length(sv, i);
      if (len == 0) {
        out += "\\ufffd";
        ++i;
      } else {
        out.append(sv, i, len);
        i += len;
      }
      continue;
    }
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (uc < 0x20) {
          char esc[8];
          std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(uc));
          out += esc;
        } else {
          out += c;
        }
    }
    ++i;
  }
  out += '"';
}

void key(std::string& out, const char* k) {
  out += '"';  out += k;  out += "\":";
}

void append_endpoint(std::string& out, const ifwatch::model::Endpoint& ep) {
  out += '{';
  key(out, "host");  append_string(out, ep.host);  out += ',';
  key(out, "port");  append_string(out, ep.port);  out += ',';
  key(out, "label");  append_string(out, ep.label);
  out += '}';
}

void append_triple(std::string& out, const ifwatch::model::Triple& t) {
  out += '{';
  key(out, "tx");  append_double(out, t.sent);  out += ',';
  key(out, "rx");  append_double(out, t.received);  out += ',';
  key(out, "total");  append_double(out, t.total);
  out += '}';
}

void append_connection(std::string& out, const ifwatch::model::ConnectionRecord& c) {
  out += '{';
  key(out, "description");  append_string(out, c.description);  out += ',';
  key(out, "local");  append_endpoint(out, c.local);  out += ',';
  key(out, "remote");  append_endpoint(out, c.remote);  out += ',';
  key(out, "rates");  out += '{';
  for (size_t w = 0; w < kWindowCount; ++w) {
    if (w) out += ',';
    key(out, ifwatch::model::window_name(w));
    out += '{';
    key(out, "tx");  append_double(out, c.rates[w].tx_bps);  out += ',';
    key(out, "rx");  append_double(out, c.rates[w].rx_bps);
    out += '}';
  }
  out += "},";
  key(out, "cumulative");  out += '{';
  key(out, "tx");  append_double(out, c.cumulative_tx_bytes);  out += ',';
  key(out, "rx");  append_double(out, c.cumulative_rx_bytes);
  out += "}}";
}

void append_sample(std::string& out, const ifwatch::model::InterfaceSample& s, double capacity_bps) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(s.sampled_at.time_since_epoch()).count();
  out += '{';
  key(out, "sampled_at_ms");  append_int(out, ms);  out += ',';
  key(out, "seq");  append_uint(out, s.seq);  out += ',';
  key(out, "connection_count");  append_uint(out, s.connection_count);  out += ',';
  key(out, "utilization");
  append_double(out, capacity_bps > 0.0 ? s.combined_bps[0] / capacity_bps : 0.0);
  out += ',';
  key(out, "totals");  out += '{';
  for (size_t w = 0; w < kWindowCount; ++w) {
    if (w) out += ',';
    key(out, ifwatch::model::window_name(w));
    out += '{';
    key(out, "tx");  append_double(out, s.totals[w].tx_bps);  out += ',';
    key(out, "rx");  append_double(out, s.totals[w].rx_bps);  out += ',';
    key(out, "total");  append_double(out, s.combined_bps[w]);
    out += '}';
  }
  out += "},";
  key(out, "peak");  append_triple(out, s.peak_bps);  out += ',';
  key(out, "cumulative");  append_triple(out, s.cumulative_bytes);  out += ',';
  key(out, "connections");  out += '[';
  for (size_t i = 0; i < s.top_connections.size(); ++i) {
    if (i) out += ',';
    append_connection(out, s.top_connections[i]);
  }
  out += "]}";
}

} // anonymous namespace

namespace ifwatch::app {

void append_interface_state(std::string& out, const InterfaceState& st) {
  out += '{';
  key(out, "id");  append_string(out, st.config.id);  out += ',';
  key(out, "capacity_bps");  append_double(out, st.config.capacity_bps);  out += ',';
  key(out, "status");  append_string(out, model::status_name(st.health.status));  out += ',';
  key(out, "consecutive_failures");  append_int(out, st.health.consecutive_failures);  out += ',';
  key(out, "message");  append_string(out, st.health.message);  out += ',';
  key(out, "has_data");  out += st.sample ? "true" : "false";  out += ',';
  key(out, "permanently_failed");
  out += (st.health.status == model::InterfaceStatus::Failed ||
          st.health.status == model::InterfaceStatus::ConfigError) ? "true" : "false";
  out += ',';
  key(out, "sample");
  if (st.sample) append_sample(out, *st.sample, st.config.capacity_bps);
  else out += "null";
  out += '}';
}

std::string full_state_message(const std::vector<InterfaceState>& states) {
  std::string out;
  out.reserve(256 + states.size() * 1024);
  out += "{\"type\":\"full_state\",\"interfaces\":[";
  for (size_t i = 0; i < states.size(); ++i) {
    if (i) out += ',';
    append_interface_state(out, states[i]);
  }
  out += "]}";
  return out;
}

std::string interface_update_message(const InterfaceState& state) {
  std::string out;
  out.reserve(1024);
  out += "{\"type\":\"interface_update\",\"interface\":";
  append_interface_state(out, state);
  out += '}';
  return out;
}

std::string interface_status_message(const std::string& id, const model::InterfaceHealth& health) {
  std::string out;
  out += "{\"type\":\"interface_status\",";
  key(out, "id");  append_string(out, id);  out += ',';
  key(out, "status");  append_string(out, model::status_name(health.status));  out += ',';
  key(out, "consecutive_failures");  append_int(out, health.consecutive_failures);  out += ',';
  key(out, "message");  append_string(out, health.message);
  out += '}';
  return out;
}

} // namespace ifwatch::app
