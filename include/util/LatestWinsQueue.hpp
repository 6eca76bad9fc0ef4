#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace ifwatch::util {

// Bounded FIFO whose producers never block: when full, the oldest item is
// dropped to make room for the newest. A single consumer waits in pop().
template <typename T>
class LatestWinsQueue {
public:
  enum class PushResult { Queued, DroppedOldest, Closed };

  explicit LatestWinsQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}
  LatestWinsQueue(const LatestWinsQueue&) = delete;
  LatestWinsQueue& operator=(const LatestWinsQueue&) = delete;

  PushResult push(T item) {
    PushResult res = PushResult::Queued;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return PushResult::Closed;
      if (items_.size() >= capacity_) {
        items_.pop_front();
        dropped_.fetch_add(1, std::memory_order_relaxed);
        res = PushResult::DroppedOldest;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return res;
  }

  // Blocks until an item arrives. nullopt once closed or stop requested.
  [[nodiscard]] std::optional<T> pop(std::stop_token st) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, st, [&]{ return closed_ || !items_.empty(); });
    if (items_.empty() || st.stop_requested()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  // Wakes the consumer; further pushes are rejected, queued items are discarded.
  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
      items_.clear();
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> items_;
  bool closed_{false};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace ifwatch::util
