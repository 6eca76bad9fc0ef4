#include "app/Broadcaster.hpp"
#include "app/Config.hpp"
#include "app/HttpServer.hpp"
#include "app/InterfaceMonitor.hpp"
#include "app/StateStore.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: ifwatchd [--config PATH] [--port N] [--check-config]\n";
  std::cout << "Samples each configured interface with iftop and streams the results\n"
               "to WebSocket clients. GET /metrics serves Prometheus text, GET /healthz liveness.\n";
  std::cout << "Config: $IFWATCH_CONFIG or $XDG_CONFIG_HOME/ifwatch/config.toml; IFWATCH_* env overrides.\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  int port_override = 0;
  bool check_only = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--port" && i + 1 < argc) {
      std::string_view v = argv[++i];
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), port_override);
      if (ec != std::errc{} || ptr != v.data() + v.size() || port_override < 1 || port_override > 65535) {
        std::fprintf(stderr, "ifwatch: invalid --port '%s'\n", argv[i]);
        return 2;
      }
    }
    else if (a == "--check-config") check_only = true;
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "ifwatch: unknown argument '%s'\n", argv[i]);
      print_usage();
      return 2;
    }
  }

  ifwatch::app::Config cfg;
  std::string error;
  if (!ifwatch::app::load_config(config_path, cfg, error)) {
    std::fprintf(stderr, "ifwatch: configuration error: %s\n", error.c_str());
    return 1;
  }
  if (port_override > 0) cfg.server.port = static_cast<uint16_t>(port_override);

  if (check_only) {
    std::cout << ifwatch::app::describe_config(cfg);
    bool any_ok = false;
    for (const auto& ic : cfg.interfaces) any_ok = any_ok || ic.config_error.empty();
    return any_ok ? 0 : 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  ifwatch::app::StateStore store(cfg.interfaces);
  ifwatch::app::Broadcaster broadcaster(store, cfg.server.queue_depth);
  store.add_listener(&broadcaster);

  ifwatch::app::HttpServer server(store, broadcaster, cfg.server);
  if (!server.start(error)) {
    std::fprintf(stderr, "ifwatch: %s\n", error.c_str());
    return 1;
  }

  std::vector<std::unique_ptr<ifwatch::app::InterfaceMonitor>> monitors;
  for (const auto& ic : store.interfaces()) {
    auto m = std::make_unique<ifwatch::app::InterfaceMonitor>(ic, store, cfg.sampler);
    m->start();
    monitors.push_back(std::move(m));
  }

  while (!g_stop.load()) {
    std::this_thread::sleep_for(200ms);
    broadcaster.reap();
  }

  std::fprintf(stderr, "ifwatch: shutting down\n");
  server.stop();
  for (auto& m : monitors) m->stop();
  broadcaster.shutdown();
  return 0;
}
