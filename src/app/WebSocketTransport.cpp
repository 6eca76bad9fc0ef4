#include "app/WebSocketTransport.hpp"

#include <openssl/evp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace ifwatch::app {

static constexpr char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr std::chrono::seconds kSendTimeout{5};

std::string websocket_accept_key(std::string_view client_key) {
  std::string input(client_key);
  input += kWebSocketGuid;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) return {};
  unsigned char encoded[4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1];
  int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
  if (n < 0) return {};
  return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(n));
}

std::string encode_frame(Opcode op, std::string_view payload, const uint8_t* mask) {
  std::string frame;
  const size_t len = payload.size();
  frame.reserve(len + 14);
  frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(op)));
  const uint8_t mask_bit = mask ? 0x80 : 0x00;
  if (len <= 125) {
    frame.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) frame.push_back(static_cast<char>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
  }
  if (!mask) {
    frame.append(payload);
    return frame;
  }
  frame.append(reinterpret_cast<const char*>(mask), 4);
  for (size_t i = 0; i < len; ++i) frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
  return frame;
}

DecodeStatus decode_frame(std::string& buf, Frame& out, bool require_mask, size_t max_payload) {
  if (buf.size() < 2) return DecodeStatus::NeedMore;
  const auto* p = reinterpret_cast<const uint8_t*>(buf.data());
  if (p[0] & 0x70) return DecodeStatus::Error;  // no extensions negotiated
  const bool fin = p[0] & 0x80;
  const uint8_t op = p[0] & 0x0F;
  const bool masked = p[1] & 0x80;
  if (require_mask && !masked) return DecodeStatus::Error;

  uint64_t len = p[1] & 0x7F;
  size_t pos = 2;
  if (len == 126) {
    if (buf.size() < 4) return DecodeStatus::NeedMore;
    len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
    pos = 4;
  } else if (len == 127) {
    if (buf.size() < 10) return DecodeStatus::NeedMore;
    len = 0;
    for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
    pos = 10;
  }

  const bool control = op & 0x08;
  if (control && (!fin || len > 125)) return DecodeStatus::Error;
  switch (op) {
    case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA: break;
    default: return DecodeStatus::Error;
  }
  if (len > max_payload) return DecodeStatus::Error;

  uint8_t key[4] = {0, 0, 0, 0};
  if (masked) {
    if (buf.size() < pos + 4) return DecodeStatus::NeedMore;
    std::memcpy(key, p + pos, 4);
    pos += 4;
  }
  if (buf.size() < pos + len) return DecodeStatus::NeedMore;

  out.fin = fin;
  out.opcode = static_cast<Opcode>(op);
  out.payload.assign(buf, pos, static_cast<size_t>(len));
  if (masked) {
    for (size_t i = 0; i < out.payload.size(); ++i) out.payload[i] = static_cast<char>(out.payload[i] ^ key[i % 4]);
  }
  buf.erase(0, pos + static_cast<size_t>(len));
  return DecodeStatus::Ok;
}

WebSocketTransport::WebSocketTransport(int fd, HttpRequest request, std::string leftover, std::string peer)
    : fd_(fd), request_(std::move(request)), rbuf_(std::move(leftover)), peer_(std::move(peer)) {
  // Reads block until the peer or close() ends them; writes give up on a stuck peer.
  struct timeval none{.tv_sec = 0, .tv_usec = 0};
  (void)::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &none, sizeof(none));
  if (!set_send_timeout(fd_, kSendTimeout)) {
    std::fprintf(stderr, "ifwatch: client %s: cannot set send timeout\n", peer_.c_str());
  }
}

WebSocketTransport::~WebSocketTransport() {
  close();
  if (fd_ >= 0) ::close(fd_);
}

bool WebSocketTransport::handshake() {
  std::string_view key = request_.header("Sec-WebSocket-Key");
  const char* problem = nullptr;
  if (request_.method != "GET") problem = "method must be GET";
  else if (!header_has_token(request_.header("Upgrade"), "websocket")) problem = "missing Upgrade: websocket";
  else if (!header_has_token(request_.header("Connection"), "upgrade")) problem = "missing Connection: Upgrade";
  else if (request_.header("Sec-WebSocket-Version") != "13") problem = "unsupported Sec-WebSocket-Version";
  else if (key.size() != 24 || !key.ends_with("==")) problem = "bad Sec-WebSocket-Key";

  std::lock_guard<std::mutex> lk(send_mu_);
  if (problem) {
    std::string body(problem);
    body += '\n';
    std::string resp = http_response(400, "Bad Request", "text/plain", body);
    if (request_.header("Sec-WebSocket-Version") != "13") {
      resp.insert(resp.find("\r\n") + 2, "Sec-WebSocket-Version: 13\r\n");
    }
    (void)write_all(fd_, resp);
    return false;
  }
  std::string accept = websocket_accept_key(key);
  if (accept.empty()) return false;
  std::string resp = "HTTP/1.1 101 Switching Protocols\r\n"
                     "Upgrade: websocket\r\n"
                     "Connection: Upgrade\r\n"
                     "Sec-WebSocket-Accept: ";
  resp += accept;
  resp += "\r\n\r\n";
  return write_all(fd_, resp);
}

bool WebSocketTransport::send_frame(Opcode op, std::string_view payload) {
  std::string frame = encode_frame(op, payload);
  std::lock_guard<std::mutex> lk(send_mu_);
  if (close_sent_ || closed_.load(std::memory_order_acquire)) return false;
  if (op == Opcode::Close) close_sent_ = true;
  return write_all(fd_, frame);
}

bool WebSocketTransport::send_text(std::string_view payload) {
  return send_frame(Opcode::Text, payload);
}

bool WebSocketTransport::next_frame(Frame& frame) {
  for (;;) {
    switch (decode_frame(rbuf_, frame, true, kMaxMessage)) {
      case DecodeStatus::Ok: return true;
      case DecodeStatus::Error: return false;
      case DecodeStatus::NeedMore: break;
    }
    char chunk[4096];
    ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    rbuf_.append(chunk, static_cast<size_t>(n));
  }
}

ReceiveStatus WebSocketTransport::receive(std::string& out) {
  out.clear();
  bool in_message = false;
  Frame frame;
  for (;;) {
    if (closed_.load(std::memory_order_acquire)) return ReceiveStatus::Closed;
    if (!next_frame(frame)) {
      return closed_.load(std::memory_order_acquire) ? ReceiveStatus::Closed : ReceiveStatus::Error;
    }
    switch (frame.opcode) {
      case Opcode::Ping:
        if (!send_frame(Opcode::Pong, frame.payload)) return ReceiveStatus::Error;
        continue;
      case Opcode::Pong:
        continue;
      case Opcode::Close:
        // echo the status code back, then stop
        (void)send_frame(Opcode::Close, std::string_view(frame.payload).substr(0, std::min<size_t>(2, frame.payload.size())));
        return ReceiveStatus::Closed;
      case Opcode::Text:
      case Opcode::Binary:
        if (in_message) return ReceiveStatus::Error;
        out = std::move(frame.payload);
        in_message = true;
        break;
      case Opcode::Continuation:
        if (!in_message) return ReceiveStatus::Error;
        if (out.size() + frame.payload.size() > kMaxMessage) return ReceiveStatus::Error;
        out += frame.payload;
        break;
    }
    if (frame.fin) return ReceiveStatus::Message;
  }
}

void WebSocketTransport::close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) return;
  // Best effort "going away" if no write is in flight.
  std::unique_lock<std::mutex> lk(send_mu_, std::try_to_lock);
  if (lk.owns_lock() && !close_sent_) {
    close_sent_ = true;
    static constexpr char kGoingAway[] = {0x03, static_cast<char>(0xE9)};  // 1001
    std::string frame = encode_frame(Opcode::Close, std::string_view(kGoingAway, 2));
    (void)::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
  }
  if (lk.owns_lock()) lk.unlock();
  ::shutdown(fd_, SHUT_RDWR);
}

} // namespace ifwatch::app
