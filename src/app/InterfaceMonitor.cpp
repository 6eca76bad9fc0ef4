#include "app/InterfaceMonitor.hpp"
#include "collectors/CaptureAccess.hpp"
#include "collectors/IftopParser.hpp"
#include "collectors/SamplerProcess.hpp"

#include <cstdio>
#include <string_view>

using namespace std::chrono;

namespace ifwatch::app {

static constexpr milliseconds kReadPoll{100};

std::vector<std::string> build_argv(const std::string& command, const std::vector<std::string>& args,
                                    const std::string& interface_id) {
  static constexpr std::string_view kPlaceholder = "{interface}";
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(command);
  for (const auto& a : args) {
    std::string out;
    size_t pos = 0;
    for (;;) {
      auto hit = a.find(kPlaceholder, pos);
      if (hit == std::string::npos) { out.append(a, pos, std::string::npos); break; }
      out.append(a, pos, hit - pos);
      out += interface_id;
      pos = hit + kPlaceholder.size();
    }
    argv.push_back(std::move(out));
  }
  return argv;
}

InterfaceMonitor::InterfaceMonitor(model::InterfaceConfig config, StateStore& store, MonitorOptions opts)
    : config_(std::move(config)), store_(store), opts_(std::move(opts)),
      backoff_(opts_.backoff_initial, opts_.backoff_max) {
  if (opts_.max_failures < 1) opts_.max_failures = 1;
}

InterfaceMonitor::~InterfaceMonitor() { stop(); }

void InterfaceMonitor::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void InterfaceMonitor::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void InterfaceMonitor::report(model::InterfaceStatus status, std::string message) {
  model::InterfaceHealth h;
  h.status = status;
  h.consecutive_failures = failures_.load(std::memory_order_relaxed);
  h.message = std::move(message);
  store_.set_health(config_.id, std::move(h));
}

bool InterfaceMonitor::check_config() {
  std::string problem;
  if (!config_.config_error.empty()) {
    problem = config_.config_error;
  } else if (!collectors::valid_interface_name(config_.id)) {
    problem = "invalid interface name";
  } else if (opts_.verify_interface && !collectors::interface_present(config_.id)) {
    problem = "interface not present";
  } else if (opts_.require_privilege && !collectors::has_capture_privilege()) {
    problem = "capture needs root or CAP_NET_RAW";
  }
  if (problem.empty()) return true;
  std::fprintf(stderr, "ifwatch: %s: configuration error: %s\n", config_.id.c_str(), problem.c_str());
  report(model::InterfaceStatus::ConfigError, problem);
  return false;
}

bool InterfaceMonitor::sleep_for(std::stop_token st, milliseconds d) {
  std::unique_lock<std::mutex> lk(sleep_mu_);
  sleep_cv_.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

void InterfaceMonitor::run(std::stop_token st) {
  if (!check_config()) {
    finished_.store(true, std::memory_order_release);
    return;
  }

  HostDirectory hosts(opts_.hosts);
  collectors::IftopParser parser(config_.id, opts_.display_cap);
  const auto argv = build_argv(opts_.command, opts_.args, config_.id);
  int failures = 0;
  report(model::InterfaceStatus::Starting);

  while (!st.stop_requested()) {
    hosts.refresh();
    parser.reset();

    collectors::SamplerProcess proc;
    std::string reason;
    if (!proc.start(argv, reason)) {
      reason = "start failed: " + reason;
    } else {
      child_pid_.store(proc.pid(), std::memory_order_relaxed);
      std::fprintf(stderr, "ifwatch: %s: sampler started (pid %d)\n", config_.id.c_str(), static_cast<int>(proc.pid()));
      bool got_sample = false;
      std::string line;
      while (!st.stop_requested()) {
        auto rs = proc.read_line(line, kReadPoll);
        if (rs == collectors::SamplerProcess::ReadStatus::Timeout) continue;
        if (rs == collectors::SamplerProcess::ReadStatus::Eof) break;
        auto sample = parser.feed(line);
        if (!sample) continue;
        for (auto& c : sample->top_connections) hosts.annotate(c);
        if (!got_sample) {
          got_sample = true;
          failures = 0;
          failures_.store(0, std::memory_order_relaxed);
          report(model::InterfaceStatus::Running);
        }
        if (!store_.update(std::move(*sample))) {
          std::fprintf(stderr, "ifwatch: %s: sample rejected by store\n", config_.id.c_str());
        }
      }
      int code = proc.terminate(opts_.terminate_grace);
      child_pid_.store(-1, std::memory_order_relaxed);
      if (st.stop_requested()) break;
      reason = !proc.last_stderr().empty() ? proc.last_stderr()
                                           : "sampler exited with status " + std::to_string(code);
    }

    ++failures;
    failures_.store(failures, std::memory_order_relaxed);
    std::fprintf(stderr, "ifwatch: %s: sampler failure %d/%d: %s\n",
                 config_.id.c_str(), failures, opts_.max_failures, reason.c_str());
    if (failures >= opts_.max_failures) {
      report(model::InterfaceStatus::Failed, reason);
      store_.clear(config_.id);
      std::fprintf(stderr, "ifwatch: %s: giving up after %d consecutive failures\n", config_.id.c_str(), failures);
      finished_.store(true, std::memory_order_release);
      return;
    }
    report(model::InterfaceStatus::Restarting, reason);
    if (!sleep_for(st, backoff_.delay_for(failures))) break;
  }

  report(model::InterfaceStatus::Stopped);
  finished_.store(true, std::memory_order_release);
}

} // namespace ifwatch::app
