#include "collectors/SamplerProcess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace ifwatch::collectors {

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

SamplerProcess::~SamplerProcess() { terminate(std::chrono::milliseconds(200)); }

bool SamplerProcess::start(const std::vector<std::string>& argv, std::string& error) {
  if (pid_ > 0) { error = "already running"; return false; }
  if (argv.empty()) { error = "empty command"; return false; }

  int out_pipe[2], err_pipe[2], exec_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) < 0) { error = std::strerror(errno); return false; }
  if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
    error = std::strerror(errno);
    ::close(out_pipe[0]); ::close(out_pipe[1]);
    return false;
  }
  if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
    error = std::strerror(errno);
    ::close(out_pipe[0]); ::close(out_pipe[1]);
    ::close(err_pipe[0]); ::close(err_pipe[1]);
    return false;
  }

  // argv must be built before fork: no allocation in the child
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t parent = ::getpid();
  pid_t pid = ::fork();
  if (pid < 0) {
    error = std::strerror(errno);
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) ::close(fd);
    return false;
  }

  if (pid == 0) {
    ::prctl(PR_SET_PDEATHSIG, SIGTERM);
    if (::getppid() != parent) ::_exit(127);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(cargv[0], cargv.data());
    int e = errno;
    (void)::write(exec_pipe[1], &e, sizeof(e));
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do { n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    error = std::string("exec ") + argv[0] + ": " + std::strerror(child_errno);
    return false;
  }

  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);
  pid_ = pid;
  out_fd_ = out_pipe[0];
  err_fd_ = err_pipe[0];
  out_eof_ = false;
  out_buf_.clear();
  err_buf_.clear();
  last_stderr_.clear();
  return true;
}

bool SamplerProcess::take_line(std::string& out) {
  auto nl = out_buf_.find('\n');
  if (nl == std::string::npos) {
    if (out_buf_.size() < kMaxLine) return false;
    nl = out_buf_.size();
  }
  out.assign(out_buf_, 0, nl);
  if (!out.empty() && out.back() == '\r') out.pop_back();
  out_buf_.erase(0, std::min(nl + 1, out_buf_.size()));
  return true;
}

bool SamplerProcess::drain_stderr() {
  char buf[1024];
  ssize_t n = ::read(err_fd_, buf, sizeof(buf));
  if (n <= 0) {
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return false;
    ::close(err_fd_);
    err_fd_ = -1;
    return false;
  }
  err_buf_.append(buf, static_cast<size_t>(n));
  size_t nl;
  while ((nl = err_buf_.find('\n')) != std::string::npos) {
    std::string line = err_buf_.substr(0, nl);
    err_buf_.erase(0, nl + 1);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (!line.empty()) last_stderr_ = std::move(line);
  }
  if (err_buf_.size() > kMaxLine) err_buf_.clear();
  return true;
}

SamplerProcess::ReadStatus SamplerProcess::read_line(std::string& out, std::chrono::milliseconds timeout) {
  if (take_line(out)) return ReadStatus::Line;
  if (out_eof_) {
    if (!out_buf_.empty()) { out.swap(out_buf_); out_buf_.clear(); return ReadStatus::Line; }
    return ReadStatus::Eof;
  }
  if (out_fd_ < 0) return ReadStatus::Eof;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    struct pollfd pfds[2];
    nfds_t nfds = 0;
    pfds[nfds++] = {.fd = out_fd_, .events = POLLIN, .revents = 0};
    if (err_fd_ >= 0) pfds[nfds++] = {.fd = err_fd_, .events = POLLIN, .revents = 0};

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() < 0) left = std::chrono::milliseconds(0);
    int rv = ::poll(pfds, nfds, static_cast<int>(left.count()));
    if (rv < 0) {
      if (errno == EINTR) continue;
      out_eof_ = true;
      return ReadStatus::Eof;
    }
    if (rv == 0) return ReadStatus::Timeout;

    if (nfds > 1 && (pfds[1].revents & (POLLIN | POLLHUP | POLLERR))) (void)drain_stderr();

    if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      char buf[4096];
      ssize_t n = ::read(out_fd_, buf, sizeof(buf));
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (n <= 0) {
        out_eof_ = true;
        // pick up the exit message the tool printed right before dying
        while (err_fd_ >= 0 && drain_stderr()) {}
        if (!out_buf_.empty()) { out.swap(out_buf_); out_buf_.clear(); return ReadStatus::Line; }
        return ReadStatus::Eof;
      }
      out_buf_.append(buf, static_cast<size_t>(n));
      if (take_line(out)) return ReadStatus::Line;
    }
    if (std::chrono::steady_clock::now() >= deadline) return ReadStatus::Timeout;
  }
}

void SamplerProcess::close_fds() {
  if (out_fd_ >= 0) { ::close(out_fd_); out_fd_ = -1; }
  if (err_fd_ >= 0) { ::close(err_fd_); err_fd_ = -1; }
}

int SamplerProcess::wait() {
  close_fds();
  if (pid_ <= 0) return -1;
  int status = 0;
  pid_t r;
  do { r = ::waitpid(pid_, &status, 0); } while (r < 0 && errno == EINTR);
  pid_ = -1;
  return r < 0 ? -1 : decode_wait_status(status);
}

int SamplerProcess::terminate(std::chrono::milliseconds grace) {
  close_fds();
  if (pid_ <= 0) return -1;
  ::kill(pid_, SIGTERM);
  int status = 0;
  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) { pid_ = -1; return decode_wait_status(status); }
    if (r < 0 && errno != EINTR) { pid_ = -1; return -1; }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ::kill(pid_, SIGKILL);
  pid_t r;
  do { r = ::waitpid(pid_, &status, 0); } while (r < 0 && errno == EINTR);
  pid_ = -1;
  return r < 0 ? -1 : decode_wait_status(status);
}

} // namespace ifwatch::collectors
