#include "app/Broadcaster.hpp"
#include "app/WireFormat.hpp"
#include <cstdio>

namespace ifwatch::app {

Broadcaster::Broadcaster(const StateStore& store, size_t queue_depth)
    : store_(store), queue_depth_(queue_depth == 0 ? 1 : queue_depth) {}

Broadcaster::~Broadcaster() { shutdown(); }

std::shared_ptr<ClientSession> Broadcaster::attach(std::unique_ptr<Transport> transport) {
  reap();
  std::lock_guard<std::mutex> lk(mu_);
  if (shutting_down_) {
    transport->close();
    return nullptr;
  }
  uint64_t id = next_id_++;
  auto session = std::make_shared<ClientSession>(
      id, std::move(transport), store_, queue_depth_,
      [this](uint64_t sid){ unregister(sid); });
  sessions_.emplace(id, session);
  // started under the lock so shutdown() cannot miss a half-registered session
  session->start();
  return session;
}

void Broadcaster::unregister(uint64_t session_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return;
  std::fprintf(stderr, "ifwatch: client %llu (%s) disconnected, delivered=%llu dropped=%llu\n",
               static_cast<unsigned long long>(session_id), it->second->peer().c_str(),
               static_cast<unsigned long long>(it->second->delivered()),
               static_cast<unsigned long long>(it->second->dropped()));
  finished_.push_back(std::move(it->second));
  sessions_.erase(it);
}

void Broadcaster::on_sample(const std::shared_ptr<const model::InterfaceSample>& sample) {
  if (!sample) return;
  InterfaceState state;
  if (auto st = store_.state(sample->interface_id)) state = std::move(*st);
  else state.config.id = sample->interface_id;
  state.sample = sample;
  publish(std::make_shared<const std::string>(interface_update_message(state)));
}

void Broadcaster::on_health(const std::string& interface_id, const model::InterfaceHealth& health) {
  publish(std::make_shared<const std::string>(interface_status_message(interface_id, health)));
}

void Broadcaster::on_cleared(const std::string& interface_id) {
  InterfaceState state;
  if (auto st = store_.state(interface_id)) state = std::move(*st);
  else state.config.id = interface_id;
  state.sample = nullptr;
  publish(std::make_shared<const std::string>(interface_update_message(state)));
}

void Broadcaster::publish(const std::shared_ptr<const std::string>& message) {
  // Enqueue under the registry lock: concurrent publishers reach every
  // session in the same relative order.
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& [id, session] : sessions_) {
    (void)id;
    (void)session->enqueue(message);
  }
  broadcast_.fetch_add(1, std::memory_order_relaxed);
}

void Broadcaster::reap() {
  std::vector<std::shared_ptr<ClientSession>> done;
  {
    std::lock_guard<std::mutex> lk(mu_);
    done.swap(finished_);
    for (const auto& s : done) dropped_retired_ += s->dropped();
  }
  for (auto& s : done) s->stop();
}

void Broadcaster::shutdown() {
  std::vector<std::shared_ptr<ClientSession>> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    shutting_down_ = true;
    all.reserve(sessions_.size() + finished_.size());
    for (auto& [id, s] : sessions_) {
      (void)id;
      all.push_back(s);
    }
    sessions_.clear();
    for (auto& s : finished_) all.push_back(std::move(s));
    finished_.clear();
    for (const auto& s : all) dropped_retired_ += s->dropped();
  }
  for (auto& s : all) s->stop();
}

size_t Broadcaster::session_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

BroadcastStats Broadcaster::stats() const {
  BroadcastStats st;
  std::lock_guard<std::mutex> lk(mu_);
  st.sessions_total = next_id_ - 1;
  st.messages_dropped = dropped_retired_;
  for (const auto& [id, s] : sessions_) {
    (void)id;
    if (s->live()) ++st.live_sessions;
    st.messages_dropped += s->dropped();
  }
  for (const auto& s : finished_) st.messages_dropped += s->dropped();
  st.messages_broadcast = broadcast_.load(std::memory_order_relaxed);
  return st;
}

} // namespace ifwatch::app
