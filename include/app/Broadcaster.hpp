#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "app/ClientSession.hpp"
#include "app/StateStore.hpp"
#include "app/Transport.hpp"

namespace ifwatch::app {

struct BroadcastStats {
  size_t live_sessions{0};
  uint64_t sessions_total{0};
  uint64_t messages_broadcast{0};
  uint64_t messages_dropped{0};
};

// Registry of client sessions. Each store update is serialized once and
// handed to every live session's queue; a slow client only ever loses its
// own oldest messages.
class Broadcaster : public IStateListener {
public:
  Broadcaster(const StateStore& store, size_t queue_depth);
  ~Broadcaster() override;
  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  // Creates, registers and starts a session. nullptr after shutdown().
  std::shared_ptr<ClientSession> attach(std::unique_ptr<Transport> transport);
  void unregister(uint64_t session_id);

  void on_sample(const std::shared_ptr<const model::InterfaceSample>& sample) override;
  void on_health(const std::string& interface_id, const model::InterfaceHealth& health) override;
  void on_cleared(const std::string& interface_id) override;
  void publish(const std::shared_ptr<const std::string>& message);

  // Joins sessions that have ended. Never call from a session thread.
  void reap();
  void shutdown();

  [[nodiscard]] size_t session_count() const;
  [[nodiscard]] BroadcastStats stats() const;

private:
  const StateStore& store_;
  const size_t queue_depth_;
  mutable std::mutex mu_;
  std::unordered_map<uint64_t, std::shared_ptr<ClientSession>> sessions_;
  std::vector<std::shared_ptr<ClientSession>> finished_;
  uint64_t next_id_{1};
  uint64_t dropped_retired_{0};
  bool shutting_down_{false};
  std::atomic<uint64_t> broadcast_{0};
};

} // namespace ifwatch::app
