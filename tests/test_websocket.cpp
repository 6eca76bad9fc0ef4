#include "minitest.hpp"
#include "app/WebSocketTransport.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <thread>

using namespace ifwatch::app;

namespace {

const uint8_t kMask[4] = {0x37, 0xfa, 0x21, 0x3d};

HttpRequest upgrade_request(const std::string& key = "dGhlIHNhbXBsZSBub25jZQ==") {
  std::string head =
    "GET / HTTP/1.1\r\n"
    "Host: localhost:8766\r\n"
    "Upgrade: websocket\r\n"
    "Connection: keep-alive, Upgrade\r\n"
    "Sec-WebSocket-Key: " + key + "\r\n"
    "Sec-WebSocket-Version: 13\r\n\r\n";
  return parse_http_request(head).value();
}

struct SocketPair {
  int server{-1};
  int client{-1};
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) { server = fds[0]; client = fds[1]; }
  }
  ~SocketPair() { if (client >= 0) ::close(client); }
};

std::string read_some(int fd, size_t want) {
  std::string out;
  char buf[4096];
  while (out.size() < want) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

std::string read_http_reply(int fd) {
  std::string out;
  char c;
  while (out.find("\r\n\r\n") == std::string::npos && ::recv(fd, &c, 1, 0) == 1) out += c;
  return out;
}

void send_all(int fd, const std::string& data) {
  ASSERT_EQ(::send(fd, data.data(), data.size(), MSG_NOSIGNAL), static_cast<ssize_t>(data.size()));
}

} // namespace

TEST(websocket_accept_key_matches_rfc_example) {
  ASSERT_EQ(websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ=="), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(frame_encoding_uses_extended_lengths) {
  auto small = encode_frame(Opcode::Text, "hi");
  ASSERT_EQ(small.size(), 4u);
  ASSERT_EQ(static_cast<uint8_t>(small[0]), 0x81);
  ASSERT_EQ(static_cast<uint8_t>(small[1]), 2);

  std::string mid(300, 'x');
  auto m = encode_frame(Opcode::Text, mid);
  ASSERT_EQ(static_cast<uint8_t>(m[1]), 126);
  ASSERT_EQ((static_cast<uint8_t>(m[2]) << 8) | static_cast<uint8_t>(m[3]), 300);
  ASSERT_EQ(m.size(), 304u);

  std::string big(70000, 'y');
  auto b = encode_frame(Opcode::Binary, big);
  ASSERT_EQ(static_cast<uint8_t>(b[0]), 0x82);
  ASSERT_EQ(static_cast<uint8_t>(b[1]), 127);
  ASSERT_EQ(b.size(), 70000u + 10u);
}

TEST(frame_decoding_unmasks_and_waits_for_more) {
  std::string wire = encode_frame(Opcode::Text, "hello", kMask);
  std::string partial = wire.substr(0, 4);
  Frame f;
  ASSERT_TRUE(decode_frame(partial, f, true, 1024) == DecodeStatus::NeedMore);
  std::string buf = wire + encode_frame(Opcode::Ping, "p", kMask);
  ASSERT_TRUE(decode_frame(buf, f, true, 1024) == DecodeStatus::Ok);
  ASSERT_TRUE(f.opcode == Opcode::Text);
  ASSERT_TRUE(f.fin);
  ASSERT_EQ(f.payload, "hello");
  ASSERT_TRUE(decode_frame(buf, f, true, 1024) == DecodeStatus::Ok);
  ASSERT_TRUE(f.opcode == Opcode::Ping);
  ASSERT_TRUE(buf.empty());
}

TEST(frame_decoding_rejects_protocol_violations) {
  Frame f;
  std::string unmasked = encode_frame(Opcode::Text, "x");
  ASSERT_TRUE(decode_frame(unmasked, f, true, 1024) == DecodeStatus::Error);
  std::string too_big = encode_frame(Opcode::Text, std::string(2000, 'a'), kMask);
  ASSERT_TRUE(decode_frame(too_big, f, true, 1024) == DecodeStatus::Error);
  std::string bad_op = encode_frame(Opcode::Text, "x", kMask);
  bad_op[0] = static_cast<char>(0x83);
  ASSERT_TRUE(decode_frame(bad_op, f, true, 1024) == DecodeStatus::Error);
  std::string long_ping = encode_frame(Opcode::Ping, std::string(200, 'p'), kMask);
  ASSERT_TRUE(decode_frame(long_ping, f, true, 1024) == DecodeStatus::Error);
}

TEST(websocket_handshake_and_text_frames) {
  SocketPair sp;
  ASSERT_TRUE(sp.server >= 0);
  WebSocketTransport t(sp.server, upgrade_request(), "", "test");
  ASSERT_TRUE(t.handshake());
  auto reply = read_http_reply(sp.client);
  ASSERT_TRUE(reply.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
  ASSERT_TRUE(reply.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);

  ASSERT_TRUE(t.send_text("{\"type\":\"full_state\"}"));
  std::string raw = read_some(sp.client, 2 + 21);
  Frame f;
  ASSERT_TRUE(decode_frame(raw, f, false, 1024) == DecodeStatus::Ok);
  ASSERT_EQ(f.payload, "{\"type\":\"full_state\"}");
}

TEST(websocket_handshake_rejects_missing_key) {
  SocketPair sp;
  auto req = upgrade_request();
  for (auto& h : req.headers) if (h.first == "Sec-WebSocket-Key") h.second = "short";
  WebSocketTransport t(sp.server, std::move(req), "", "test");
  ASSERT_FALSE(t.handshake());
  auto reply = read_http_reply(sp.client);
  ASSERT_TRUE(reply.starts_with("HTTP/1.1 400 Bad Request"));
}

TEST(websocket_answers_ping_and_reports_close) {
  SocketPair sp;
  WebSocketTransport t(sp.server, upgrade_request(), "", "test");
  ASSERT_TRUE(t.handshake());
  (void)read_http_reply(sp.client);

  send_all(sp.client, encode_frame(Opcode::Ping, "are-you-there", kMask));
  send_all(sp.client, encode_frame(Opcode::Text, "hel", kMask).replace(0, 1, 1, static_cast<char>(0x01)));
  send_all(sp.client, encode_frame(Opcode::Continuation, "lo", kMask));
  std::string msg;
  ASSERT_TRUE(t.receive(msg) == ReceiveStatus::Message);
  ASSERT_EQ(msg, "hello");

  std::string raw = read_some(sp.client, 2 + 13);
  Frame pong;
  ASSERT_TRUE(decode_frame(raw, pong, false, 1024) == DecodeStatus::Ok);
  ASSERT_TRUE(pong.opcode == Opcode::Pong);
  ASSERT_EQ(pong.payload, "are-you-there");

  const char code[2] = {0x03, static_cast<char>(0xE8)};
  send_all(sp.client, encode_frame(Opcode::Close, std::string(code, 2), kMask));
  ASSERT_TRUE(t.receive(msg) == ReceiveStatus::Closed);
  std::string echo = read_some(sp.client, 4);
  Frame close;
  ASSERT_TRUE(decode_frame(echo, close, false, 1024) == DecodeStatus::Ok);
  ASSERT_TRUE(close.opcode == Opcode::Close);
  ASSERT_FALSE(t.send_text("after close"));
}

TEST(websocket_close_unblocks_reader) {
  SocketPair sp;
  WebSocketTransport t(sp.server, upgrade_request(), "", "test");
  ASSERT_TRUE(t.handshake());
  ReceiveStatus rs = ReceiveStatus::Message;
  std::thread reader([&]{ std::string m; rs = t.receive(m); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  t.close();
  reader.join();
  ASSERT_TRUE(rs == ReceiveStatus::Closed);
}

TEST(websocket_leftover_bytes_are_read_first) {
  SocketPair sp;
  WebSocketTransport t(sp.server, upgrade_request(), encode_frame(Opcode::Text, "early", kMask), "test");
  ASSERT_TRUE(t.handshake());
  std::string msg;
  ASSERT_TRUE(t.receive(msg) == ReceiveStatus::Message);
  ASSERT_EQ(msg, "early");
}
