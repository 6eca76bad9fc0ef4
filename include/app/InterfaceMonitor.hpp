#pragma once
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/HostDirectory.hpp"
#include "app/StateStore.hpp"
#include "collectors/Backoff.hpp"
#include "model/Interface.hpp"

namespace ifwatch::app {

struct MonitorOptions {
  std::string command{"iftop"};
  std::vector<std::string> args{"-i", "{interface}", "-t", "-P", "-N"};
  size_t display_cap{10};
  int max_failures{5};
  std::chrono::milliseconds backoff_initial{1000};
  std::chrono::milliseconds backoff_max{30000};
  std::chrono::milliseconds terminate_grace{1000};
  bool require_privilege{true};
  bool verify_interface{true};
  HostDirectoryOptions hosts;
};

// command followed by args, every "{interface}" replaced by interface_id
[[nodiscard]] std::vector<std::string> build_argv(const std::string& command,
                                                  const std::vector<std::string>& args,
                                                  const std::string& interface_id);

// Supervises the sampling subprocess of one interface on its own thread:
// start, parse, publish to the store, restart with backoff on exit, give up
// after max_failures consecutive failures.
class InterfaceMonitor {
public:
  InterfaceMonitor(model::InterfaceConfig config, StateStore& store, MonitorOptions opts);
  ~InterfaceMonitor();
  InterfaceMonitor(const InterfaceMonitor&) = delete;
  InterfaceMonitor& operator=(const InterfaceMonitor&) = delete;

  void start();
  // Terminates the child and joins. Idempotent.
  void stop();

  [[nodiscard]] const std::string& interface_id() const { return config_.id; }
  [[nodiscard]] int consecutive_failures() const { return failures_.load(std::memory_order_relaxed); }
  [[nodiscard]] pid_t child_pid() const { return child_pid_.load(std::memory_order_relaxed); }
  [[nodiscard]] bool finished() const { return finished_.load(std::memory_order_acquire); }

private:
  void run(std::stop_token st);
  [[nodiscard]] bool check_config();
  // false if stop was requested before the delay elapsed
  [[nodiscard]] bool sleep_for(std::stop_token st, std::chrono::milliseconds d);
  void report(model::InterfaceStatus status, std::string message = {});

  model::InterfaceConfig config_;
  StateStore& store_;
  MonitorOptions opts_;
  collectors::Backoff backoff_;
  std::atomic<int> failures_{0};
  std::atomic<pid_t> child_pid_{-1};
  std::atomic<bool> finished_{false};
  std::mutex sleep_mu_;
  std::condition_variable_any sleep_cv_;
  std::jthread thread_;
};

} // namespace ifwatch::app
