#include "minitest.hpp"
#include "fake_transport.hpp"
#include "iftop_fixtures.hpp"
#include "sampler_script.hpp"
#include "app/Broadcaster.hpp"
#include "app/InterfaceMonitor.hpp"

using namespace ifwatch;

namespace {

size_t count_updates_for(const std::vector<std::string>& msgs, const std::string& id) {
  size_t n = 0;
  const std::string prefix = "{\"type\":\"interface_update\",\"interface\":{\"id\":\"" + id + "\"";
  for (const auto& m : msgs) if (m.starts_with(prefix)) ++n;
  return n;
}

} // namespace

TEST(end_to_end_updates_only_reach_clients_for_the_sampled_interface) {
  auto lines = fixtures::banner();
  for (const auto& l : fixtures::two_connection_block()) lines.push_back(l);
  for (const auto& l : fixtures::two_connection_block()) lines.push_back(l);
  SamplerScript busy("e2e_eth0", fixtures::text(lines));
  SamplerScript idle("e2e_eth1");

  app::StateStore store({{"eth0", 500000000.0, ""}, {"eth1", 500000000.0, ""}});
  app::Broadcaster bc(store, 16);
  store.add_listener(&bc);

  auto wire = std::make_shared<Wire>();
  auto session = bc.attach(std::make_unique<FakeTransport>(wire));
  ASSERT_TRUE(session != nullptr);
  ASSERT_TRUE(wait_until([&]{ return session->live() && wire->count() >= 1; }));

  app::InterfaceMonitor m0(store.interfaces()[0], store, busy.options("exec sleep 30"));
  app::InterfaceMonitor m1(store.interfaces()[1], store, idle.options("exec sleep 30"));
  m0.start();
  m1.start();

  ASSERT_TRUE(wait_until([&]{ return count_updates_for(wire->messages(), "eth0") == 2; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  auto msgs = wire->messages();
  ASSERT_TRUE(msgs[0].starts_with("{\"type\":\"full_state\""));
  ASSERT_EQ(count_updates_for(msgs, "eth0"), 2u);
  ASSERT_EQ(count_updates_for(msgs, "eth1"), 0u);
  ASSERT_TRUE(store.snapshot("eth1") == nullptr);
  ASSERT_EQ(store.snapshot("eth0")->seq, 2u);

  m0.stop();
  m1.stop();
  ASSERT_TRUE(wait_until([&]{
    for (const auto& m : wire->messages()) {
      if (m.find("\"id\":\"eth1\",\"status\":\"stopped\"") != std::string::npos) return true;
    }
    return false;
  }));
  bc.shutdown();
  ASSERT_TRUE(wire->is_closed());
}
