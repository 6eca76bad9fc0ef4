#pragma once
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ifwatch::app {

// One jthread per accepted connection, so a client that never finishes its
// request head only ever holds up its own thread. The accept loop stays free.
class ConnectionPool {
public:
  // Runs on the connection's thread and owns fd.
  using Handler = std::function<void(int fd, std::string peer)>;

  ConnectionPool(Handler handler, size_t max_active);
  ~ConnectionPool();
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Takes ownership of fd. Returns false, with fd closed, when max_active
  // handlers are still running or after shutdown().
  bool dispatch(int fd, std::string peer);

  // Joins handlers that have returned.
  void reap();
  // Refuses new connections and joins every handler.
  void shutdown();

  [[nodiscard]] size_t active() const;

private:
  struct Worker {
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  Handler handler_;
  const size_t max_active_;
  mutable std::mutex mu_;
  std::list<std::unique_ptr<Worker>> workers_;
  bool shutting_down_{false};
};

} // namespace ifwatch::app
