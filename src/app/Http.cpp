#include "app/Http.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <charconv>

namespace ifwatch::app {

static constexpr size_t kMaxHead = 16 * 1024;

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

bool header_has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    auto comma = value.find(',');
    std::string_view part = trim(value.substr(0, comma));
    if (iequals(part, token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

std::string_view HttpRequest::header(std::string_view name) const {
  for (const auto& [k, v] : headers) {
    if (iequals(k, name)) return v;
  }
  return {};
}

std::optional<HttpRequest> parse_http_request(std::string_view head) {
  auto eol = head.find('\n');
  std::string_view line = trim(head.substr(0, eol));
  HttpRequest req;

  auto sp1 = line.find(' ');
  if (sp1 == std::string_view::npos) return std::nullopt;
  auto sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) return std::nullopt;
  req.method = std::string(line.substr(0, sp1));
  std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  req.version = std::string(line.substr(sp2 + 1));
  if (req.method.empty() || target.empty() || target.front() != '/') return std::nullopt;
  if (!req.version.starts_with("HTTP/1.")) return std::nullopt;
  if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);
  req.target = std::string(target);

  while (eol != std::string_view::npos) {
    head.remove_prefix(eol + 1);
    eol = head.find('\n');
    std::string_view h = trim(head.substr(0, eol));
    if (h.empty()) break;
    auto colon = h.find(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    req.headers.emplace_back(std::string(trim(h.substr(0, colon))), std::string(trim(h.substr(colon + 1))));
  }
  return req;
}

HeadStatus read_http_head(int fd, std::string& head, std::string& leftover, std::chrono::milliseconds timeout) {
  head.clear();
  leftover.clear();
  std::string buf;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto end = buf.find("\r\n\r\n");
    if (end != std::string::npos) {
      head.assign(buf, 0, end + 4);
      leftover.assign(buf, end + 4, std::string::npos);
      return HeadStatus::Ok;
    }
    if (buf.size() > kMaxHead) return HeadStatus::TooLarge;

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) return HeadStatus::Timeout;
    struct pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (rv < 0) {
      if (errno == EINTR) continue;
      return HeadStatus::Closed;
    }
    if (rv == 0) return HeadStatus::Timeout;

    char chunk[2048];
    ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    if (n <= 0) return HeadStatus::Closed;
    buf.append(chunk, static_cast<size_t>(n));
  }
}

std::string http_response(int code, std::string_view reason, std::string_view content_type, std::string_view body) {
  std::string out;
  out.reserve(128 + body.size());
  char num[24];
  out += "HTTP/1.1 ";
  auto [p1, ec1] = std::to_chars(num, num + sizeof(num), code);
  out.append(num, p1);
  out += ' ';
  out += reason;
  out += "\r\nContent-Type: ";
  out += content_type;
  out += "\r\nConnection: close\r\nContent-Length: ";
  auto [p2, ec2] = std::to_chars(num, num + sizeof(num), body.size());
  out.append(num, p2);
  out += "\r\n\r\n";
  out += body;
  return out;
}

bool set_send_timeout(int fd, std::chrono::seconds timeout) {
  struct timeval tv{.tv_sec = static_cast<time_t>(timeout.count()), .tv_usec = 0};
  return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    data.remove_prefix(static_cast<size_t>(n));
  }
  return true;
}

} // namespace ifwatch::app
