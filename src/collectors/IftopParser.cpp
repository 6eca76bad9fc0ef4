#include "collectors/IftopParser.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace ifwatch::collectors {

namespace {

std::vector<std::string_view> split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    if (i > start) out.push_back(sv.substr(start, i - start));
  }
  return out;
}

bool all_digits(std::string_view sv) {
  if (sv.empty()) return false;
  return std::all_of(sv.begin(), sv.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)); });
}

bool is_terminator(std::string_view trimmed) {
  if (trimmed.size() < 3) return false;
  return std::all_of(trimmed.begin(), trimmed.end(), [](char c){ return c == '='; });
}

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

struct Label { const char* prefix; LineKind kind; };

// Longest prefixes first: "Total send and receive" shares a prefix with "Total send".
constexpr Label kLabels[] = {
  {"Total send and receive rate", LineKind::TotalCombined},
  {"Total send rate", LineKind::TotalSend},
  {"Total receive rate", LineKind::TotalReceive},
  {"Peak rate", LineKind::Peak},
  {"Cumulative", LineKind::Cumulative},
};

ParsedLine classify_labelled(LineKind kind, const std::vector<std::string_view>& toks) {
  ParsedLine pl;
  // values follow the token that closes the label ("rate:", "(sent/received/total):")
  size_t first = toks.size();
  for (size_t i = 0; i < toks.size(); ++i) {
    if (toks[i].back() == ':') { first = i + 1; break; }
  }
  if (first + model::kWindowCount > toks.size()) {
    pl.kind = LineKind::Malformed;
    return pl;
  }
  for (size_t w = 0; w < model::kWindowCount; ++w) {
    auto q = parse_quantity(toks[first + w]);
    if (q.status != QuantityStatus::Ok) {
      pl.kind = LineKind::Malformed;
      return pl;
    }
    pl.values[w] = q.bits;
  }
  pl.kind = kind;
  return pl;
}

} // namespace

Quantity parse_quantity(std::string_view token) {
  Quantity q;
  size_t i = 0;
  bool digits = false;
  while (i < token.size() && (std::isdigit(static_cast<unsigned char>(token[i])) || token[i] == '.')) {
    if (token[i] != '.') digits = true;
    ++i;
  }
  if (!digits) return q;
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + i, v);
  if (ec != std::errc{} || ptr != token.data() + i || !std::isfinite(v)) return q;

  std::string_view unit = token.substr(i);
  double mult = 1.0;
  if (!unit.empty()) {
    switch (unit.front()) {
      case 'k': case 'K': mult = 1e3; unit.remove_prefix(1); break;
      case 'M': mult = 1e6; unit.remove_prefix(1); break;
      case 'G': mult = 1e9; unit.remove_prefix(1); break;
      case 'T': mult = 1e12; unit.remove_prefix(1); break;
      default: break;
    }
  }
  if (unit == "B") {
    mult *= 8.0;
  } else if (!unit.empty() && unit != "b") {
    q.status = QuantityStatus::BadUnit;
    return q;
  }
  q.status = QuantityStatus::Ok;
  q.bits = v * mult;
  return q;
}

model::Endpoint parse_endpoint(std::string_view token) {
  model::Endpoint ep;
  auto colon = token.rfind(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == token.size()) {
    ep.host = std::string(token);
    return ep;
  }
  auto host = token.substr(0, colon);
  if (host.find(':') != std::string_view::npos) {
    // IPv6: a port is only split off when what remains is still an address,
    // so "fe80::1" stays whole. "2001:db8::1:8080" assumes -P output.
    in6_addr addr{};
    if (::inet_pton(AF_INET6, std::string(host).c_str(), &addr) != 1) {
      ep.host = std::string(token);
      return ep;
    }
  }
  ep.host = std::string(host);
  ep.port = std::string(token.substr(colon + 1));
  return ep;
}

ParsedLine classify_line(std::string_view line) {
  ParsedLine pl;
  auto trimmed = trim(line);
  if (trimmed.empty()) return pl;
  if (is_terminator(trimmed)) { pl.kind = LineKind::Terminator; return pl; }

  auto toks = split_ws(trimmed);
  size_t arrow = toks.size();
  for (size_t i = 0; i < toks.size(); ++i) {
    if (toks[i] == "=>" || toks[i] == "<=") { arrow = i; break; }
  }

  if (arrow < toks.size()) {
    pl.direction = (toks[arrow] == "=>") ? Direction::Out : Direction::In;
    if (arrow == 2 && all_digits(toks[0])) {
      pl.has_index = true;
      pl.endpoint = parse_endpoint(toks[1]);
    } else if (arrow == 1) {
      pl.endpoint = parse_endpoint(toks[0]);
    } else {
      pl.kind = LineKind::Malformed;
      return pl;
    }
    // 2s 10s 40s cumulative
    if (toks.size() - arrow - 1 < model::kWindowCount + 1) {
      pl.kind = LineKind::Malformed;
      return pl;
    }
    bool bad_unit = false;
    for (size_t k = 0; k <= model::kWindowCount; ++k) {
      auto q = parse_quantity(toks[arrow + 1 + k]);
      if (q.status == QuantityStatus::Invalid) { pl.kind = LineKind::Malformed; return pl; }
      if (q.status == QuantityStatus::BadUnit) { bad_unit = true; continue; }
      if (k < model::kWindowCount) pl.values[k] = q.bits; else pl.cumulative_bits = q.bits;
    }
    pl.kind = bad_unit ? LineKind::BadUnit : LineKind::Connection;
    return pl;
  }

  for (const auto& l : kLabels) {
    if (trimmed.starts_with(l.prefix)) return classify_labelled(l.kind, toks);
  }
  return pl;
}

void order_connections(std::vector<model::ConnectionRecord>& conns, size_t cap) {
  const auto key = [](const model::ConnectionRecord& c) {
    return c.rates[static_cast<size_t>(model::Window::Short)].combined();
  };
  std::stable_sort(conns.begin(), conns.end(), [&](const model::ConnectionRecord& a, const model::ConnectionRecord& b) {
    double ka = key(a), kb = key(b);
    if (ka != kb) return ka > kb;
    auto la = a.local.to_string(), lb = b.local.to_string();
    if (la != lb) return la < lb;
    return a.remote.to_string() < b.remote.to_string();
  });
  if (conns.size() > cap) conns.resize(cap);
}

IftopParser::IftopParser(std::string interface_id, size_t display_cap, Clock clock)
    : interface_id_(std::move(interface_id)), display_cap_(display_cap), clock_(std::move(clock)) {}

std::optional<model::InterfaceSample> IftopParser::feed(std::string_view line) {
  ParsedLine pl = classify_line(line);
  switch (pl.kind) {
    case LineKind::Ignored:
      break;
    case LineKind::Terminator:
      return finish_block();
    case LineKind::Malformed:
      malformed_ = true;
      break;
    case LineKind::Connection:
    case LineKind::BadUnit:
      apply_connection(pl);
      break;
    case LineKind::TotalSend:
      close_pending();
      for (size_t w = 0; w < model::kWindowCount; ++w) totals_[w].tx_bps = pl.values[w];
      have_send_ = true;
      break;
    case LineKind::TotalReceive:
      close_pending();
      for (size_t w = 0; w < model::kWindowCount; ++w) totals_[w].rx_bps = pl.values[w];
      have_receive_ = true;
      break;
    case LineKind::TotalCombined:
      close_pending();
      combined_ = pl.values;
      have_combined_ = true;
      break;
    case LineKind::Peak:
      close_pending();
      peak_ = model::Triple{pl.values[0], pl.values[1], pl.values[2]};
      break;
    case LineKind::Cumulative:
      close_pending();
      cumulative_ = model::Triple{pl.values[0] / 8.0, pl.values[1] / 8.0, pl.values[2] / 8.0};
      break;
  }
  return std::nullopt;
}

void IftopParser::apply_connection(const ParsedLine& pl) {
  if (malformed_) return;
  if (pending_ && pl.has_index) {
    // previous record never got its second line
    malformed_ = true;
    return;
  }
  if (!pending_) pending_.emplace();
  auto& p = *pending_;
  bool& have = (pl.direction == Direction::Out) ? p.have_out : p.have_in;
  if (have) { malformed_ = true; return; }
  have = true;

  if (pl.kind == LineKind::BadUnit) {
    p.discard = true;
    ++stats_.lines_discarded;
  } else if (pl.direction == Direction::Out) {
    p.record.local = pl.endpoint;
    for (size_t w = 0; w < model::kWindowCount; ++w) p.record.rates[w].tx_bps = pl.values[w];
    p.record.cumulative_tx_bytes = pl.cumulative_bits / 8.0;
  } else {
    p.record.remote = pl.endpoint;
    for (size_t w = 0; w < model::kWindowCount; ++w) p.record.rates[w].rx_bps = pl.values[w];
    p.record.cumulative_rx_bytes = pl.cumulative_bits / 8.0;
  }

  if (p.have_out && p.have_in) {
    if (!p.discard) {
      if (connections_.size() >= kMaxConnectionsPerBlock) malformed_ = true;
      else connections_.push_back(std::move(p.record));
    }
    pending_.reset();
  }
}

void IftopParser::close_pending() {
  if (pending_) {
    malformed_ = true;
    pending_.reset();
  }
}

std::optional<model::InterfaceSample> IftopParser::finish_block() {
  std::optional<model::InterfaceSample> result;
  if (!malformed_ && !pending_ && have_send_ && have_receive_) {
    model::InterfaceSample s;
    s.interface_id = interface_id_;
    s.totals = totals_;
    for (size_t w = 0; w < model::kWindowCount; ++w) {
      s.combined_bps[w] = have_combined_ ? combined_[w] : totals_[w].combined();
    }
    s.peak_bps = peak_;
    s.cumulative_bytes = cumulative_;
    s.connection_count = connections_.size();
    order_connections(connections_, display_cap_);
    s.top_connections = std::move(connections_);
    s.sampled_at = clock_ ? clock_() : std::chrono::system_clock::now();
    ++stats_.blocks_emitted;
    result = std::move(s);
  } else {
    ++stats_.blocks_discarded;
  }
  reset();
  return result;
}

void IftopParser::reset() {
  connections_.clear();
  pending_.reset();
  malformed_ = false;
  have_send_ = have_receive_ = have_combined_ = false;
  totals_ = {};
  combined_ = {};
  peak_ = {};
  cumulative_ = {};
}

} // namespace ifwatch::collectors
