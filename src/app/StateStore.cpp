#include "app/StateStore.hpp"

namespace ifwatch::app {

StateStore::StateStore(std::vector<model::InterfaceConfig> interfaces) {
  for (auto& cfg : interfaces) {
    if (find(cfg.id)) continue;  // first entry wins
    auto slot = std::make_unique<Slot>();
    slot->config = cfg;
    model::InterfaceHealth h;
    if (!cfg.config_error.empty()) {
      h.status = model::InterfaceStatus::ConfigError;
      h.message = cfg.config_error;
    }
    slot->health.store(std::make_shared<const model::InterfaceHealth>(std::move(h)));
    configs_.push_back(cfg);
    slots_.push_back(std::move(slot));
  }
}

StateStore::Slot* StateStore::find(std::string_view id) const {
  for (const auto& s : slots_) {
    if (s->config.id == id) return s.get();
  }
  return nullptr;
}

std::vector<IStateListener*> StateStore::listeners() const {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  return listeners_;
}

bool StateStore::update(model::InterfaceSample sample) {
  Slot* slot = find(sample.interface_id);
  if (!slot) return false;
  sample.seq = slot->seq.fetch_add(1, std::memory_order_relaxed) + 1;
  auto sp = std::make_shared<const model::InterfaceSample>(std::move(sample));
  slot->sample.store(sp, std::memory_order_release);
  for (auto* l : listeners()) l->on_sample(sp);
  return true;
}

void StateStore::clear(std::string_view id) {
  Slot* slot = find(id);
  if (!slot) return;
  auto prev = slot->sample.exchange(nullptr, std::memory_order_acq_rel);
  if (!prev) return;
  for (auto* l : listeners()) l->on_cleared(slot->config.id);
}

std::shared_ptr<const model::InterfaceSample> StateStore::snapshot(std::string_view id) const {
  const Slot* slot = find(id);
  if (!slot) return nullptr;
  return slot->sample.load(std::memory_order_acquire);
}

InterfaceState StateStore::load(const Slot& slot) {
  InterfaceState st;
  st.config = slot.config;
  st.sample = slot.sample.load(std::memory_order_acquire);
  auto h = slot.health.load(std::memory_order_acquire);
  if (h) st.health = *h;
  st.samples = slot.seq.load(std::memory_order_relaxed);
  return st;
}

std::vector<InterfaceState> StateStore::snapshot_all() const {
  std::vector<InterfaceState> out;
  out.reserve(slots_.size());
  for (const auto& s : slots_) out.push_back(load(*s));
  return out;
}

std::optional<InterfaceState> StateStore::state(std::string_view id) const {
  const Slot* slot = find(id);
  if (!slot) return std::nullopt;
  return load(*slot);
}

void StateStore::set_health(std::string_view id, model::InterfaceHealth health) {
  Slot* slot = find(id);
  if (!slot) return;
  auto next = std::make_shared<const model::InterfaceHealth>(std::move(health));
  auto prev = slot->health.exchange(next, std::memory_order_acq_rel);
  bool changed = !prev || prev->status != next->status ||
                 prev->consecutive_failures != next->consecutive_failures;
  if (!changed) return;
  for (auto* l : listeners()) l->on_health(slot->config.id, *next);
}

model::InterfaceHealth StateStore::health(std::string_view id) const {
  const Slot* slot = find(id);
  if (!slot) return {};
  auto h = slot->health.load(std::memory_order_acquire);
  return h ? *h : model::InterfaceHealth{};
}

void StateStore::add_listener(IStateListener* listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(listener);
}

} // namespace ifwatch::app
