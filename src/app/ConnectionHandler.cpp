#include "app/HttpServer.hpp"
#include "app/WebSocketTransport.hpp"

#include <unistd.h>

#include <cstdio>
#include <memory>

namespace ifwatch::app {

static constexpr std::chrono::milliseconds kHeadTimeout{5000};
static constexpr std::chrono::seconds kResponseSendTimeout{5};

Route route_request(const std::optional<HttpRequest>& req, std::string_view ws_path) {
  if (!req) return Route::BadRequest;
  if (header_has_token(req->header("Upgrade"), "websocket")) {
    return req->target == ws_path ? Route::Upgrade : Route::NotFound;
  }
  if (req->method != "GET" && req->method != "HEAD") return Route::BadRequest;
  if (req->target == "/metrics") return Route::Metrics;
  if (req->target == "/healthz") return Route::Health;
  return Route::NotFound;
}

static bool any_interface_alive(const std::vector<InterfaceState>& states) {
  for (const auto& s : states) {
    if (s.health.status != model::InterfaceStatus::Failed &&
        s.health.status != model::InterfaceStatus::ConfigError) return true;
  }
  return false;
}

void serve_connection(int fd, std::string peer, const StateStore& store, Broadcaster& broadcaster,
                      std::string_view ws_path) {
  if (!set_send_timeout(fd, kResponseSendTimeout)) {
    std::fprintf(stderr, "ifwatch: %s: cannot set send timeout\n", peer.c_str());
    ::close(fd);
    return;
  }
  std::string head, leftover;
  auto hs = read_http_head(fd, head, leftover, kHeadTimeout);
  if (hs != HeadStatus::Ok) {
    if (hs == HeadStatus::TooLarge) {
      (void)write_all(fd, http_response(431, "Request Header Fields Too Large", "text/plain", "header too large\n"));
    }
    ::close(fd);
    return;
  }

  auto req = parse_http_request(head);
  std::string resp;
  switch (route_request(req, ws_path)) {
    case Route::Upgrade: {
      auto transport = std::make_unique<WebSocketTransport>(fd, std::move(*req), std::move(leftover), peer);
      std::fprintf(stderr, "ifwatch: client %s connected\n", peer.c_str());
      // on shutdown attach() closes the transport, which owns the fd now
      (void)broadcaster.attach(std::move(transport));
      return;
    }
    case Route::Metrics:
      resp = http_response(200, "OK", "text/plain; version=0.0.4; charset=utf-8",
                           snapshot_to_prometheus(read_metrics_snapshot(store, broadcaster)));
      break;
    case Route::Health:
      if (any_interface_alive(store.snapshot_all())) resp = http_response(200, "OK", "text/plain", "ok\n");
      else resp = http_response(503, "Service Unavailable", "text/plain", "no interface can be monitored\n");
      break;
    case Route::NotFound:
      resp = http_response(404, "Not Found", "text/plain", "404 Not Found\n");
      break;
    case Route::BadRequest:
      resp = http_response(400, "Bad Request", "text/plain", "400 Bad Request\n");
      break;
  }
  if (req && req->method == "HEAD") resp.resize(resp.find("\r\n\r\n") + 4);
  (void)write_all(fd, resp);
  ::close(fd);
}

} // namespace ifwatch::app
