#include "app/ConnectionPool.hpp"
#include <unistd.h>
#include <cstdio>
#include <iterator>

namespace ifwatch::app {

ConnectionPool::ConnectionPool(Handler handler, size_t max_active)
    : handler_(std::move(handler)), max_active_(max_active == 0 ? 1 : max_active) {}

ConnectionPool::~ConnectionPool() { shutdown(); }

bool ConnectionPool::dispatch(int fd, std::string peer) {
  reap();
  std::lock_guard<std::mutex> lk(mu_);
  size_t running = 0;
  for (const auto& w : workers_) {
    if (!w->done.load(std::memory_order_acquire)) ++running;
  }
  if (shutting_down_ || running >= max_active_) {
    if (!shutting_down_) {
      std::fprintf(stderr, "ifwatch: %zu connections pending, refusing %s\n", running, peer.c_str());
    }
    ::close(fd);
    return false;
  }
  auto worker = std::make_unique<Worker>();
  Worker* w = worker.get();
  w->thread = std::jthread([this, w, fd, peer = std::move(peer)]() mutable {
    handler_(fd, std::move(peer));
    w->done.store(true, std::memory_order_release);
  });
  workers_.push_back(std::move(worker));
  return true;
}

void ConnectionPool::reap() {
  std::list<std::unique_ptr<Worker>> finished;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      auto next = std::next(it);
      if ((*it)->done.load(std::memory_order_acquire)) finished.splice(finished.end(), workers_, it);
      it = next;
    }
  }
  // jthread destructors join outside the lock
}

void ConnectionPool::shutdown() {
  std::list<std::unique_ptr<Worker>> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    shutting_down_ = true;
    all.swap(workers_);
  }
  for (auto& w : all) {
    if (w->thread.joinable()) w->thread.join();
  }
}

size_t ConnectionPool::active() const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t running = 0;
  for (const auto& w : workers_) {
    if (!w->done.load(std::memory_order_acquire)) ++running;
  }
  return running;
}

} // namespace ifwatch::app
