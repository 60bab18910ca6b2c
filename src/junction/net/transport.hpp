#pragma once

#include "junction/net/buffer.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>

namespace junction::net {

enum class TransportOperation : int {
  CONNECT,   // Resolving and connecting the tcp socket
  HANDSHAKE, // tls and websocket handshakes
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The stream is being closed
};

constexpr std::string_view str(TransportOperation op) {
#define CASE(x)                                                                                    \
  case TransportOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

// ------------------------------------------------------------------------------- TransportListener

/**
 * @brief Receives the events of a single duplex connection.
 *
 * All callbacks are executed on the transport's execution context, one at a time.
 */
class TransportListener {
public:
  virtual ~TransportListener() = default;

  /**
   * @brief The connection has been established, and frames can be sent.
   */
  virtual void on_open() {}

  /**
   * @brief A frame has been received.
   * @note `payload` is only valid for the duration of the call.
   */
  virtual void on_receive(std::span<const std::byte> payload, FrameKind kind) = 0;

  /**
   * @brief The connection was closed, either end could have initiated it.
   */
  virtual void on_close(uint16_t close_code, std::string_view reason) {}

  /**
   * @brief Non-write errors result in the connection being closed.
   */
  virtual void on_error(TransportOperation operation, std::error_code ec) {}
};

// --------------------------------------------------------------------------------------- Transport

/**
 * @brief The sending side of a single duplex, message-oriented connection.
 *
 * Sends are fire-and-forget. Nothing is queued while the transport is not open, and the
 * transport never reconnects by itself.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief true iff frames can currently be sent.
   */
  virtual bool is_open() const = 0;

  /**
   * @brief Send a single frame.
   * @return `ecode::not_connected` if the transport is not open.
   */
  virtual std::error_code send_frame(BufferType&& buffer, FrameKind kind) = 0;

  /**
   * @brief Close the connection.
   * @param close_code A type byte integer sent to the other endpoint.
   * @param reason An optional utf-8 encoded string.
   * @see https://datatracker.ietf.org/doc/html/rfc6455#section-7.1.2
   */
  virtual void close(uint16_t close_code = 1000, std::string_view reason = "") = 0;
};

} // namespace junction::net
