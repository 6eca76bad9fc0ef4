#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include "app/Broadcaster.hpp"
#include "app/Config.hpp"
#include "app/ConnectionPool.hpp"
#include "app/Http.hpp"
#include "app/StateStore.hpp"

namespace ifwatch::app {

// Point-in-time view for metrics serialization.
struct MetricsSnapshot {
  std::vector<InterfaceState> interfaces;
  BroadcastStats clients;
};

// Serialize a MetricsSnapshot into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string snapshot_to_prometheus(const MetricsSnapshot& snap);

[[nodiscard]] inline MetricsSnapshot read_metrics_snapshot(const StateStore& store, const Broadcaster& broadcaster) {
  return MetricsSnapshot{store.snapshot_all(), broadcaster.stats()};
}

enum class Route { Metrics, Health, Upgrade, NotFound, BadRequest };

[[nodiscard]] Route route_request(const std::optional<HttpRequest>& req, std::string_view ws_path);

// Handles one accepted connection and takes ownership of fd: plain HTTP
// requests are answered and closed, WebSocket upgrades on ws_path become
// broadcaster sessions.
void serve_connection(int fd, std::string peer, const StateStore& store, Broadcaster& broadcaster,
                      std::string_view ws_path);

// Listening socket plus accept loop on its own thread. Serves /metrics,
// /healthz and the WebSocket endpoint on one port; each accepted connection
// is served on a ConnectionPool thread.
class HttpServer {
public:
  HttpServer(const StateStore& store, Broadcaster& broadcaster, ServerConfig cfg);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens synchronously so startup errors reach the caller.
  [[nodiscard]] bool start(std::string& error);
  void stop();

private:
  void run(std::stop_token st);

  const StateStore& store_;
  Broadcaster& broadcaster_;
  ServerConfig cfg_;
  ConnectionPool pool_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace ifwatch::app
