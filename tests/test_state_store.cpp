#include "minitest.hpp"
#include "app/StateStore.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace ifwatch;

namespace {

struct RecordingListener : app::IStateListener {
  std::vector<std::string> samples;
  std::vector<std::pair<std::string, model::InterfaceStatus>> health;
  void on_sample(const std::shared_ptr<const model::InterfaceSample>& s) override { samples.push_back(s->interface_id); }
  void on_health(const std::string& id, const model::InterfaceHealth& h) override { health.emplace_back(id, h.status); }
  void on_cleared(const std::string& id) override { cleared.push_back(id); }
  std::vector<std::string> cleared;
};

std::vector<model::InterfaceConfig> two_interfaces() {
  return {{"eth0", 500000000.0, ""}, {"eth1", 100000000.0, ""}};
}

model::InterfaceSample sample_for(const std::string& id, double rate) {
  model::InterfaceSample s;
  s.interface_id = id;
  s.combined_bps[0] = rate;
  return s;
}

} // namespace

TEST(store_starts_empty_for_every_interface) {
  app::StateStore store(two_interfaces());
  ASSERT_TRUE(store.snapshot("eth0") == nullptr);
  auto all = store.snapshot_all();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all[0].config.id, "eth0");
  ASSERT_EQ(all[1].config.id, "eth1");
  ASSERT_TRUE(all[1].sample == nullptr);
  ASSERT_TRUE(all[0].health.status == model::InterfaceStatus::Starting);
}

TEST(store_update_replaces_and_numbers_samples) {
  app::StateStore store(two_interfaces());
  ASSERT_TRUE(store.update(sample_for("eth0", 10.0)));
  ASSERT_TRUE(store.update(sample_for("eth0", 20.0)));
  auto s = store.snapshot("eth0");
  ASSERT_TRUE(s != nullptr);
  ASSERT_EQ(s->combined_bps[0], 20.0);
  ASSERT_EQ(s->seq, 2u);
  ASSERT_TRUE(store.snapshot("eth1") == nullptr);
}

TEST(store_rejects_unconfigured_interface) {
  app::StateStore store(two_interfaces());
  RecordingListener l;
  store.add_listener(&l);
  ASSERT_FALSE(store.update(sample_for("wlan0", 1.0)));
  ASSERT_TRUE(l.samples.empty());
  ASSERT_FALSE(store.state("wlan0").has_value());
}

TEST(store_keeps_first_of_duplicate_ids) {
  app::StateStore store({{"eth0", 1.0, ""}, {"eth0", 2.0, ""}});
  ASSERT_EQ(store.interfaces().size(), 1u);
  ASSERT_EQ(store.state("eth0")->config.capacity_bps, 1.0);
}

TEST(store_config_error_entry_reports_status) {
  app::StateStore store({{"eth0", 1.0, ""}, {"bad0", -5.0, "capacity_bps must be a positive number"}});
  auto h = store.health("bad0");
  ASSERT_TRUE(h.status == model::InterfaceStatus::ConfigError);
  ASSERT_EQ(h.message, "capacity_bps must be a positive number");
  ASSERT_TRUE(store.health("eth0").status == model::InterfaceStatus::Starting);
}

TEST(store_notifies_listeners) {
  app::StateStore store(two_interfaces());
  RecordingListener l;
  store.add_listener(&l);
  (void)store.update(sample_for("eth1", 1.0));
  ASSERT_EQ(l.samples.size(), 1u);
  ASSERT_EQ(l.samples[0], "eth1");

  model::InterfaceHealth h;
  h.status = model::InterfaceStatus::Running;
  store.set_health("eth1", h);
  h.message = "same status, new text";
  store.set_health("eth1", h);  // no status/failure change: no event
  h.status = model::InterfaceStatus::Restarting;
  h.consecutive_failures = 1;
  store.set_health("eth1", h);
  ASSERT_EQ(l.health.size(), 2u);
  ASSERT_TRUE(l.health[1].second == model::InterfaceStatus::Restarting);
  ASSERT_EQ(store.health("eth1").consecutive_failures, 1);
}

TEST(store_clear_withdraws_sample_and_keeps_count) {
  app::StateStore store(two_interfaces());
  RecordingListener l;
  store.add_listener(&l);
  store.clear("eth0");
  ASSERT_TRUE(l.cleared.empty());  // nothing to withdraw yet

  ASSERT_TRUE(store.update(sample_for("eth0", 1.0)));
  ASSERT_TRUE(store.update(sample_for("eth0", 2.0)));
  store.clear("eth0");
  store.clear("eth9");
  ASSERT_TRUE(store.snapshot("eth0") == nullptr);
  ASSERT_EQ(l.cleared.size(), 1u);
  ASSERT_EQ(l.cleared[0], "eth0");
  ASSERT_EQ(store.state("eth0")->samples, 2u);

  // a later sample continues the sequence
  ASSERT_TRUE(store.update(sample_for("eth0", 3.0)));
  ASSERT_EQ(store.snapshot("eth0")->seq, 3u);
}

TEST(store_readers_never_see_torn_samples) {
  app::StateStore store(two_interfaces());
  std::atomic<bool> done{false};
  std::atomic<bool> torn{false};
  std::thread writer([&]{
    for (int i = 1; i <= 2000; ++i) {
      auto s = sample_for("eth0", static_cast<double>(i));
      s.combined_bps[1] = static_cast<double>(i);
      s.combined_bps[2] = static_cast<double>(i);
      (void)store.update(std::move(s));
    }
    done = true;
  });
  while (!done) {
    if (auto s = store.snapshot("eth0")) {
      if (s->combined_bps[0] != s->combined_bps[1] || s->combined_bps[1] != s->combined_bps[2]) torn = true;
    }
  }
  writer.join();
  ASSERT_FALSE(torn.load());
  ASSERT_EQ(store.snapshot("eth0")->seq, 2000u);
}
