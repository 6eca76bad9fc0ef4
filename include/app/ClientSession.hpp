#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include "app/StateStore.hpp"
#include "app/Transport.hpp"
#include "util/LatestWinsQueue.hpp"

namespace ifwatch::app {

// One connected display client. The writer thread performs the handshake,
// writes the full_state message, then drains the outbound queue in FIFO
// order. The reader thread watches for the client going away.
class ClientSession {
public:
  using Message = std::shared_ptr<const std::string>;
  using CloseHook = std::function<void(uint64_t)>;

  ClientSession(uint64_t id, std::unique_ptr<Transport> transport, const StateStore& store,
                size_t queue_depth, CloseHook on_close);
  ~ClientSession();
  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  void start();
  // Closes the transport and joins both threads. Not callable from the session's own threads.
  void stop();

  // Never blocks. False if the session is not live (handshake pending or closed).
  bool enqueue(Message msg);

  [[nodiscard]] uint64_t id() const { return id_; }
  [[nodiscard]] bool live() const { return live_.load(std::memory_order_acquire); }
  [[nodiscard]] bool finished() const { return finished_.load(std::memory_order_acquire); }
  [[nodiscard]] uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
  [[nodiscard]] uint64_t dropped() const { return queue_.dropped(); }
  [[nodiscard]] std::string peer() const { return transport_->peer(); }

private:
  void write_loop(std::stop_token st);
  void read_loop(std::stop_token st);
  void finish();

  const uint64_t id_;
  std::unique_ptr<Transport> transport_;
  const StateStore& store_;
  CloseHook on_close_;
  util::LatestWinsQueue<Message> queue_;
  std::atomic<bool> live_{false};
  std::atomic<bool> finished_{false};
  std::atomic<uint64_t> delivered_{0};
  std::mutex phase_mu_;
  std::condition_variable_any phase_cv_;
  bool handshake_done_{false};
  std::jthread writer_;
  std::jthread reader_;
};

} // namespace ifwatch::app
