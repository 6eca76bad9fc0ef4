#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ifwatch::app {

struct HttpRequest {
  std::string method;
  std::string target;   // path only, query string stripped
  std::string version;
  std::vector<std::pair<std::string, std::string>> headers;

  // Case-insensitive lookup; empty if absent
  [[nodiscard]] std::string_view header(std::string_view name) const;
};

[[nodiscard]] bool iequals(std::string_view a, std::string_view b);
// True if the comma-separated header value lists token (case-insensitive)
[[nodiscard]] bool header_has_token(std::string_view value, std::string_view token);

// Parses a request head (request line + headers, terminator optional).
[[nodiscard]] std::optional<HttpRequest> parse_http_request(std::string_view head);

// Reads from fd until "\r\n\r\n". Bytes past the head are left in leftover.
enum class HeadStatus { Ok, Closed, TooLarge, Timeout };
[[nodiscard]] HeadStatus read_http_head(int fd, std::string& head, std::string& leftover,
                                        std::chrono::milliseconds timeout);

[[nodiscard]] std::string http_response(int code, std::string_view reason,
                                        std::string_view content_type, std::string_view body);

// SO_SNDTIMEO on fd, so a peer that stops reading fails write_all instead
// of blocking it forever.
[[nodiscard]] bool set_send_timeout(int fd, std::chrono::seconds timeout);

// Loops over partial writes. False on error or send timeout.
[[nodiscard]] bool write_all(int fd, std::string_view data);

} // namespace ifwatch::app
