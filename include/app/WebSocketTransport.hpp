#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include "app/Http.hpp"
#include "app/Transport.hpp"

namespace ifwatch::app {

// RFC 6455 framing, server side
enum class Opcode : uint8_t { Continuation = 0x0, Text = 0x1, Binary = 0x2, Close = 0x8, Ping = 0x9, Pong = 0xA };

struct Frame {
  bool fin{true};
  Opcode opcode{Opcode::Text};
  std::string payload;
};

enum class DecodeStatus { Ok, NeedMore, Error };

// Sec-WebSocket-Accept for a client key
[[nodiscard]] std::string websocket_accept_key(std::string_view client_key);

// mask != nullptr produces a client-to-server (masked) frame.
[[nodiscard]] std::string encode_frame(Opcode op, std::string_view payload, const uint8_t* mask = nullptr);

// Consumes one complete frame from the front of buf.
[[nodiscard]] DecodeStatus decode_frame(std::string& buf, Frame& out, bool require_mask, size_t max_payload);

// WebSocket connection over an accepted socket whose HTTP upgrade request
// has already been read. Owns the fd.
class WebSocketTransport : public Transport {
public:
  static constexpr size_t kMaxMessage = 1 << 20;

  WebSocketTransport(int fd, HttpRequest request, std::string leftover, std::string peer);
  ~WebSocketTransport() override;
  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  bool handshake() override;
  bool send_text(std::string_view payload) override;
  ReceiveStatus receive(std::string& out) override;
  void close() override;
  [[nodiscard]] std::string peer() const override { return peer_; }

private:
  bool send_frame(Opcode op, std::string_view payload);
  // Reads until one complete frame is buffered.
  bool next_frame(Frame& frame);

  int fd_;
  HttpRequest request_;
  std::string rbuf_;
  std::string peer_;
  std::mutex send_mu_;
  std::atomic<bool> closed_{false};
  bool close_sent_{false};  // guarded by send_mu_
};

} // namespace ifwatch::app
