#include "minitest.hpp"
#include "fake_transport.hpp"
#include "app/HttpServer.hpp"
#include "app/WebSocketTransport.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <chrono>
#include <unistd.h>

using namespace ifwatch;
using namespace ifwatch::app;

namespace {

struct Client {
  int fd{-1};
  int server_fd{-1};
  Client() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) { server_fd = fds[0]; fd = fds[1]; }
  }
  ~Client() { if (fd >= 0) ::close(fd); }

  void send(const std::string& s) const {
    ASSERT_EQ(::send(fd, s.data(), s.size(), MSG_NOSIGNAL), static_cast<ssize_t>(s.size()));
  }
  std::string read_to_eof() const {
    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) out.append(buf, static_cast<size_t>(n));
    return out;
  }
};

std::vector<model::InterfaceConfig> one_interface() { return {{"eth0", 500000000.0, ""}}; }

std::string exchange(const StateStore& store, Broadcaster& bc, const std::string& request) {
  Client c;
  c.send(request);
  serve_connection(c.server_fd, "test", store, bc, "/");
  return c.read_to_eof();
}

} // namespace

TEST(http_request_parsing) {
  auto req = parse_http_request("GET /metrics?x=1 HTTP/1.1\r\nHost: a\r\nUPGRADE:  WebSocket \r\n\r\n");
  ASSERT_TRUE(req.has_value());
  ASSERT_EQ(req->method, "GET");
  ASSERT_EQ(req->target, "/metrics");
  ASSERT_EQ(req->version, "HTTP/1.1");
  ASSERT_EQ(req->header("upgrade"), "WebSocket");
  ASSERT_EQ(req->header("missing"), "");

  ASSERT_FALSE(parse_http_request("GET metrics HTTP/1.1\r\n\r\n").has_value());
  ASSERT_FALSE(parse_http_request("GET / SPDY/3\r\n\r\n").has_value());
  ASSERT_FALSE(parse_http_request("GET / HTTP/1.1\r\nno-colon-here\r\n\r\n").has_value());
  ASSERT_FALSE(parse_http_request("garbage").has_value());
}

TEST(http_header_tokens) {
  ASSERT_TRUE(header_has_token("keep-alive, Upgrade", "upgrade"));
  ASSERT_TRUE(header_has_token("websocket", "websocket"));
  ASSERT_FALSE(header_has_token("upgrades", "upgrade"));
  ASSERT_FALSE(header_has_token("", "upgrade"));
}

TEST(http_routing) {
  auto route = [](const char* head, const char* path = "/live") {
    return route_request(parse_http_request(head), path);
  };
  ASSERT_TRUE(route("GET /metrics HTTP/1.1\r\n\r\n") == Route::Metrics);
  ASSERT_TRUE(route("HEAD /healthz HTTP/1.1\r\n\r\n") == Route::Health);
  ASSERT_TRUE(route("GET /live HTTP/1.1\r\nUpgrade: websocket\r\n\r\n") == Route::Upgrade);
  ASSERT_TRUE(route("GET /other HTTP/1.1\r\nUpgrade: websocket\r\n\r\n") == Route::NotFound);
  ASSERT_TRUE(route("GET /nope HTTP/1.1\r\n\r\n") == Route::NotFound);
  ASSERT_TRUE(route("POST /metrics HTTP/1.1\r\n\r\n") == Route::BadRequest);
  ASSERT_TRUE(route("not http") == Route::BadRequest);
}

TEST(http_serves_metrics_and_health) {
  StateStore store(one_interface());
  Broadcaster bc(store, 4);

  auto metrics = exchange(store, bc, "GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n");
  ASSERT_TRUE(metrics.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(metrics.find("ifwatch_interface_capacity_bps{interface=\"eth0\"} ") != std::string::npos);
  ASSERT_TRUE(metrics.find("ifwatch_clients_connected 0") != std::string::npos);

  auto health = exchange(store, bc, "GET /healthz HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(health.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(health.ends_with("ok\n"));

  auto head = exchange(store, bc, "HEAD /healthz HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(head.ends_with("\r\n\r\n"));

  auto missing = exchange(store, bc, "GET /index.html HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(missing.starts_with("HTTP/1.1 404 Not Found\r\n"));
}

TEST(http_send_timeout_bounds_writes_to_a_stalled_reader) {
  Client c;
  ASSERT_TRUE(set_send_timeout(c.server_fd, std::chrono::seconds(1)));
  struct timeval tv{};
  socklen_t len = sizeof(tv);
  ASSERT_EQ(::getsockopt(c.server_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, &len), 0);
  ASSERT_EQ(tv.tv_sec, 1);

  // the client never reads: the write fails once the socket buffer is full
  std::string big(16 * 1024 * 1024, 'x');
  auto t0 = std::chrono::steady_clock::now();
  ASSERT_FALSE(write_all(c.server_fd, big));
  auto waited = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(waited < std::chrono::seconds(4));
  ::close(c.server_fd);

  ASSERT_FALSE(set_send_timeout(-1, std::chrono::seconds(1)));
}

TEST(http_health_fails_when_no_interface_can_run) {
  StateStore store({{"eth0", 0.0, "capacity_bps must be positive"}});
  Broadcaster bc(store, 4);
  auto health = exchange(store, bc, "GET /healthz HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(health.starts_with("HTTP/1.1 503 Service Unavailable\r\n"));
}

TEST(http_upgrade_becomes_websocket_session) {
  StateStore store(one_interface());
  Broadcaster bc(store, 4);
  store.add_listener(&bc);

  Client c;
  c.send("GET / HTTP/1.1\r\n"
         "Host: localhost\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
         "Sec-WebSocket-Version: 13\r\n\r\n");
  serve_connection(c.server_fd, "test", store, bc, "/");

  std::string buf;
  char chunk[4096];
  while (buf.find("\r\n\r\n") == std::string::npos) {
    ssize_t n = ::recv(c.fd, chunk, sizeof(chunk), 0);
    ASSERT_TRUE(n > 0);
    buf.append(chunk, static_cast<size_t>(n));
  }
  ASSERT_TRUE(buf.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
  buf.erase(0, buf.find("\r\n\r\n") + 4);

  Frame f;
  while (decode_frame(buf, f, false, 1 << 20) == DecodeStatus::NeedMore) {
    ssize_t n = ::recv(c.fd, chunk, sizeof(chunk), 0);
    ASSERT_TRUE(n > 0);
    buf.append(chunk, static_cast<size_t>(n));
  }
  ASSERT_TRUE(f.opcode == Opcode::Text);
  ASSERT_TRUE(f.payload.starts_with("{\"type\":\"full_state\""));
  ASSERT_TRUE(wait_until([&]{ return bc.stats().live_sessions == 1; }));
  bc.shutdown();
  ASSERT_EQ(bc.session_count(), 0u);
}
