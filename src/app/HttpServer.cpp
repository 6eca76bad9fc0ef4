#include "app/HttpServer.hpp"
#include <liburing.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace ifwatch::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

// Connections still reading their request head or writing a response.
static constexpr size_t kMaxPendingConnections = 64;

static std::string describe_peer(const sockaddr_storage& ss) {
  char host[INET6_ADDRSTRLEN] = {0};
  uint16_t port = 0;
  if (ss.ss_family == AF_INET) {
    const auto* a = reinterpret_cast<const sockaddr_in*>(&ss);
    ::inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host));
    port = ntohs(a->sin_port);
    return std::string(host) + ":" + std::to_string(port);
  }
  if (ss.ss_family == AF_INET6) {
    const auto* a = reinterpret_cast<const sockaddr_in6*>(&ss);
    ::inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host));
    port = ntohs(a->sin6_port);
    return "[" + std::string(host) + "]:" + std::to_string(port);
  }
  return "unknown";
}

HttpServer::HttpServer(const StateStore& store, Broadcaster& broadcaster, ServerConfig cfg)
    : store_(store), broadcaster_(broadcaster), cfg_(std::move(cfg)),
      pool_([this](int fd, std::string peer) {
              serve_connection(fd, std::move(peer), store_, broadcaster_, cfg_.path);
            },
            kMaxPendingConnections) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string& error) {
  sockaddr_storage addr{};
  socklen_t addr_len = 0;
  int family = AF_INET;
  if (cfg_.bind.find(':') != std::string::npos) {
    auto* a6 = reinterpret_cast<sockaddr_in6*>(&addr);
    a6->sin6_family = AF_INET6;
    a6->sin6_port = htons(cfg_.port);
    if (::inet_pton(AF_INET6, cfg_.bind.c_str(), &a6->sin6_addr) != 1) { error = "bad bind address " + cfg_.bind; return false; }
    addr_len = sizeof(sockaddr_in6);
    family = AF_INET6;
  } else {
    auto* a4 = reinterpret_cast<sockaddr_in*>(&addr);
    a4->sin_family = AF_INET;
    a4->sin_port = htons(cfg_.port);
    if (::inet_pton(AF_INET, cfg_.bind.c_str(), &a4->sin_addr) != 1) { error = "bad bind address " + cfg_.bind; return false; }
    addr_len = sizeof(sockaddr_in);
  }

  listen_fd_ = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    error = std::string("socket() failed: ") + std::strerror(errno);
    return false;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), addr_len) < 0) {
    error = "bind(" + cfg_.bind + ":" + std::to_string(cfg_.port) + ") failed: " + std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (::listen(listen_fd_, 16) < 0) {
    error = std::string("listen() failed: ") + std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  // Create eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    error = std::string("eventfd() failed: ") + std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  std::fprintf(stderr, "ifwatch: listening on %s:%d (websocket path %s)\n",
               cfg_.bind.c_str(), cfg_.port, cfg_.path.c_str());
  return true;
}

void HttpServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  pool_.shutdown();
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void HttpServer::run(std::stop_token st) {
  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "ifwatch: http server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  // Submit poll requests for listen_fd and stop_eventfd
  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "ifwatch: http server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) break;

    if (tag == UringTag::ListenPoll && res >= 0) {
      // drain the backlog; the socket is non-blocking
      for (;;) {
        sockaddr_storage peer{};
        socklen_t plen = sizeof(peer);
        int client_fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &plen, SOCK_CLOEXEC);
        if (client_fd < 0) {
          if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::fprintf(stderr, "ifwatch: http server: accept4() failed: %s\n", std::strerror(errno));
          }
          break;
        }
        int one = 1;
        (void)::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        (void)pool_.dispatch(client_fd, describe_peer(peer));
      }
      pool_.reap();
      broadcaster_.reap();
    }
    // Re-arm listen poll
    submit_poll(listen_fd_, UringTag::ListenPoll);
    io_uring_submit(&ring);
  }

  io_uring_queue_exit(&ring);
}

} // namespace ifwatch::app
