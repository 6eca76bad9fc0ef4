#pragma once
#include <string>
#include <string_view>

namespace ifwatch::app {

enum class ReceiveStatus { Message, Closed, Error };

// Message-oriented client connection. send_text() is only called from the
// session's writer thread and receive() only from its reader thread; close()
// may be called from any thread and must unblock both.
class Transport {
public:
  virtual ~Transport() = default;

  // Server side of the protocol handshake. False: reject and drop the client.
  [[nodiscard]] virtual bool handshake() = 0;

  [[nodiscard]] virtual bool send_text(std::string_view payload) = 0;

  // Blocks for the next application message. Control traffic (ping/pong)
  // is handled inside the transport.
  [[nodiscard]] virtual ReceiveStatus receive(std::string& out) = 0;

  virtual void close() = 0;

  // Human-friendly peer description for diagnostics
  [[nodiscard]] virtual std::string peer() const = 0;
};

} // namespace ifwatch::app
