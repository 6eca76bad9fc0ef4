#pragma once
#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>

namespace ifwatch::collectors {

// One child process with its stdout exposed as a line stream.
// stderr is drained alongside; its last non-empty line is kept for diagnostics.
class SamplerProcess {
public:
  enum class ReadStatus { Line, Timeout, Eof };

  SamplerProcess() = default;
  ~SamplerProcess();
  SamplerProcess(const SamplerProcess&) = delete;
  SamplerProcess& operator=(const SamplerProcess&) = delete;

  // fork/exec argv[0] (PATH lookup). On failure returns false and fills error.
  [[nodiscard]] bool start(const std::vector<std::string>& argv, std::string& error);

  [[nodiscard]] ReadStatus read_line(std::string& out, std::chrono::milliseconds timeout);

  // Reap after end of stream. Returns the exit code, or 128+signal.
  int wait();

  // SIGTERM, then SIGKILL once grace expires; always reaps.
  int terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] bool running() const { return pid_ > 0; }
  [[nodiscard]] const std::string& last_stderr() const { return last_stderr_; }

private:
  static constexpr size_t kMaxLine = 64 * 1024;

  void close_fds();
  bool drain_stderr();  // false once nothing more is readable right now
  [[nodiscard]] bool take_line(std::string& out);

  pid_t pid_{-1};
  int out_fd_{-1};
  int err_fd_{-1};
  bool out_eof_{false};
  std::string out_buf_;
  std::string err_buf_;
  std::string last_stderr_;
};

[[nodiscard]] int decode_wait_status(int status);

} // namespace ifwatch::collectors
