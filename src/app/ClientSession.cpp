#include "app/ClientSession.hpp"
#include "app/WireFormat.hpp"
#include <cstdio>

namespace ifwatch::app {

ClientSession::ClientSession(uint64_t id, std::unique_ptr<Transport> transport, const StateStore& store,
                             size_t queue_depth, CloseHook on_close)
    : id_(id), transport_(std::move(transport)), store_(store), on_close_(std::move(on_close)),
      queue_(queue_depth) {}

ClientSession::~ClientSession() { stop(); }

void ClientSession::start() {
  if (writer_.joinable()) return;
  writer_ = std::jthread([this](std::stop_token st){ write_loop(st); });
  reader_ = std::jthread([this](std::stop_token st){ read_loop(st); });
}

void ClientSession::stop() {
  writer_.request_stop();
  reader_.request_stop();
  live_.store(false, std::memory_order_release);
  queue_.close();
  transport_->close();
  {
    std::lock_guard<std::mutex> lk(phase_mu_);
  }
  phase_cv_.notify_all();
  if (writer_.joinable()) writer_.join();
  if (reader_.joinable()) reader_.join();
}

bool ClientSession::enqueue(Message msg) {
  if (!live()) return false;
  return queue_.push(std::move(msg)) != util::LatestWinsQueue<Message>::PushResult::Closed;
}

void ClientSession::finish() {
  if (finished_.exchange(true, std::memory_order_acq_rel)) return;
  live_.store(false, std::memory_order_release);
  queue_.close();
  transport_->close();
  {
    std::lock_guard<std::mutex> lk(phase_mu_);
  }
  phase_cv_.notify_all();
  if (on_close_) on_close_(id_);
}

void ClientSession::write_loop(std::stop_token st) {
  if (!transport_->handshake()) {
    std::fprintf(stderr, "ifwatch: client %llu (%s): handshake rejected\n",
                 static_cast<unsigned long long>(id_), transport_->peer().c_str());
    finish();
    return;
  }
  // Go live before taking the snapshot: a sample landing in between is queued, not lost.
  live_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lk(phase_mu_);
    handshake_done_ = true;
  }
  phase_cv_.notify_all();

  if (!transport_->send_text(full_state_message(store_.snapshot_all()))) {
    finish();
    return;
  }
  delivered_.fetch_add(1, std::memory_order_relaxed);

  while (!st.stop_requested()) {
    auto msg = queue_.pop(st);
    if (!msg) break;
    if (!transport_->send_text(**msg)) {
      std::fprintf(stderr, "ifwatch: client %llu (%s): write failed, closing\n",
                   static_cast<unsigned long long>(id_), transport_->peer().c_str());
      break;
    }
    delivered_.fetch_add(1, std::memory_order_relaxed);
  }
  finish();
}

void ClientSession::read_loop(std::stop_token st) {
  {
    std::unique_lock<std::mutex> lk(phase_mu_);
    phase_cv_.wait(lk, st, [&]{ return handshake_done_ || finished(); });
  }
  if (st.stop_requested() || finished()) return;

  std::string msg;
  while (!st.stop_requested()) {
    // Clients have nothing to request; text messages are read and dropped.
    if (transport_->receive(msg) != ReceiveStatus::Message) break;
  }
  finish();
}

} // namespace ifwatch::app
