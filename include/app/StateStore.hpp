#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Interface.hpp"
#include "model/Sample.hpp"

namespace ifwatch::app {

class IStateListener {
public:
  virtual ~IStateListener() = default;
  // Called on the updating interface's thread. Must not block.
  virtual void on_sample(const std::shared_ptr<const model::InterfaceSample>& sample) = 0;
  virtual void on_health(const std::string& interface_id, const model::InterfaceHealth& health) = 0;
  // The interface's last sample was withdrawn; it reports no data from now on.
  virtual void on_cleared(const std::string& interface_id) = 0;
};

struct InterfaceState {
  model::InterfaceConfig config;
  std::shared_ptr<const model::InterfaceSample> sample;  // nullptr: no data yet
  model::InterfaceHealth health;
  uint64_t samples{0};  // samples stored since start; survives clear()
};

// Latest sample per configured interface. Each slot is replaced wholesale
// through an atomic shared_ptr, so readers never see a half-written sample
// and interfaces never contend with each other.
class StateStore {
public:
  explicit StateStore(std::vector<model::InterfaceConfig> interfaces);
  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;

  // Returns false (sample dropped) for an interface that is not configured.
  bool update(model::InterfaceSample sample);

  // Drops the interface's sample so readers see "no data". Listeners are
  // told only when a sample was actually present.
  void clear(std::string_view id);

  [[nodiscard]] std::shared_ptr<const model::InterfaceSample> snapshot(std::string_view id) const;
  [[nodiscard]] std::vector<InterfaceState> snapshot_all() const;
  [[nodiscard]] std::optional<InterfaceState> state(std::string_view id) const;

  void set_health(std::string_view id, model::InterfaceHealth health);
  [[nodiscard]] model::InterfaceHealth health(std::string_view id) const;

  // Register before monitors start; listeners must outlive the store's writers.
  void add_listener(IStateListener* listener);

  [[nodiscard]] const std::vector<model::InterfaceConfig>& interfaces() const { return configs_; }

private:
  struct Slot {
    model::InterfaceConfig config;
    std::atomic<std::shared_ptr<const model::InterfaceSample>> sample;
    std::atomic<std::shared_ptr<const model::InterfaceHealth>> health;
    std::atomic<uint64_t> seq{0};
  };

  [[nodiscard]] Slot* find(std::string_view id) const;
  [[nodiscard]] static InterfaceState load(const Slot& slot);
  [[nodiscard]] std::vector<IStateListener*> listeners() const;

  std::vector<model::InterfaceConfig> configs_;
  std::vector<std::unique_ptr<Slot>> slots_;
  mutable std::mutex listeners_mu_;
  std::vector<IStateListener*> listeners_;
};

} // namespace ifwatch::app
