#include "minitest.hpp"
#include "fake_transport.hpp"
#include "app/ConnectionPool.hpp"
#include "app/HttpServer.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>

using namespace ifwatch;
using namespace ifwatch::app;

namespace {

struct SocketPair {
  int server{-1};
  int client{-1};
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) { server = fds[0]; client = fds[1]; }
  }
  ~SocketPair() { if (client >= 0) ::close(client); }
  void close_client() { ::close(client); client = -1; }
};

std::string read_to_eof(int fd) {
  std::string out;
  char buf[4096];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) out.append(buf, static_cast<size_t>(n));
  return out;
}

} // namespace

TEST(pool_answers_requests_while_another_client_stays_silent) {
  StateStore store({{"eth0", 500000000.0, ""}});
  Broadcaster bc(store, 4);
  ConnectionPool pool([&](int fd, std::string peer) {
                        serve_connection(fd, std::move(peer), store, bc, "/");
                      },
                      8);

  SocketPair silent, busy;
  ASSERT_TRUE(pool.dispatch(silent.server, "silent"));
  ASSERT_TRUE(pool.dispatch(busy.server, "busy"));

  auto t0 = std::chrono::steady_clock::now();
  std::string req = "GET /healthz HTTP/1.1\r\n\r\n";
  ASSERT_EQ(::send(busy.client, req.data(), req.size(), MSG_NOSIGNAL), static_cast<ssize_t>(req.size()));
  auto resp = read_to_eof(busy.client);
  ASSERT_TRUE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
  // well inside the silent client's five second head timeout
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));

  ASSERT_TRUE(wait_until([&]{ return pool.active() == 1; }));
  silent.close_client();
  ASSERT_TRUE(wait_until([&]{ return pool.active() == 0; }));
  pool.shutdown();
}

TEST(pool_refuses_connections_beyond_its_limit) {
  std::atomic<bool> release{false};
  std::atomic<int> served{0};
  ConnectionPool pool([&](int fd, std::string) {
                        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
                        ++served;
                        ::close(fd);
                      },
                      2);

  SocketPair a, b, c;
  ASSERT_TRUE(pool.dispatch(a.server, "a"));
  ASSERT_TRUE(pool.dispatch(b.server, "b"));
  ASSERT_FALSE(pool.dispatch(c.server, "c"));
  // the refused connection is closed at once
  char byte;
  ASSERT_EQ(::recv(c.client, &byte, 1, 0), 0);
  ASSERT_EQ(pool.active(), 2u);

  release = true;
  ASSERT_TRUE(wait_until([&]{ return pool.active() == 0; }));
  SocketPair d;
  ASSERT_TRUE(pool.dispatch(d.server, "d"));
  pool.shutdown();
  ASSERT_EQ(served.load(), 3);
}

TEST(pool_shutdown_joins_handlers_and_refuses_new_work) {
  std::atomic<int> served{0};
  ConnectionPool pool([&](int fd, std::string) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                        ++served;
                        ::close(fd);
                      },
                      4);
  SocketPair a, b;
  ASSERT_TRUE(pool.dispatch(a.server, "a"));
  pool.shutdown();
  ASSERT_EQ(served.load(), 1);
  ASSERT_FALSE(pool.dispatch(b.server, "b"));
  char byte;
  ASSERT_EQ(::recv(b.client, &byte, 1, 0), 0);
  ASSERT_EQ(pool.active(), 0u);
}
