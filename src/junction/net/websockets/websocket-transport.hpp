#pragma once

#include "connection-url.hpp"

#include "junction/net/buffer.hpp"
#include "junction/net/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <memory>

namespace junction::net {

/**
 * @brief A websocket client connection (`ws://` or `wss://`), as a `Transport`.
 *
 * All io happens on a strand of the passed io_context, and all listener callbacks are executed
 * there, so they never run concurrently, however many threads run the io_context. Writes are
 * queued, and sent in order. The transport connects at most once: it never
 * reconnects, and a closed transport stays closed.
 */
class WebsocketTransport final : public Transport {
public:
  using StrandType = boost::asio::strand<boost::asio::io_context::executor_type>;

  struct Config {
    bool verify_peer = true; //!< Verify the server's certificate chain and host name (wss only)
    std::chrono::milliseconds handshake_timeout{30'000};
  };

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  /**
   * Exceptions
   * + std::bad_alloc
   */
  WebsocketTransport(boost::asio::io_context& io_context, Config config);
  explicit WebsocketTransport(boost::asio::io_context& io_context);
  WebsocketTransport(const WebsocketTransport&) = delete;
  WebsocketTransport(WebsocketTransport&&) = delete;
  ~WebsocketTransport() override;
  WebsocketTransport& operator=(const WebsocketTransport&) = delete;
  WebsocketTransport& operator=(WebsocketTransport&&) = delete;

  /**
   * @brief Start connecting to `target`. Returns immediately; the outcome is reported through
   *        `listener` (`on_open`, or `on_error`).
   * @return `ecode::already_connected` if `connect` was already called.
   */
  std::error_code connect(const ConnectionTarget& target,
                          std::weak_ptr<TransportListener> listener);

  /**
   * @brief The strand that runs all io and listener callbacks. Handlers of timers bound to it
   *        are serialized with the listener callbacks.
   */
  StrandType get_executor() const;

  bool is_open() const override;
  std::error_code send_frame(BufferType&& buffer, FrameKind kind) override;
  void close(uint16_t close_code = 1000, std::string_view reason = "") override;
};

} // namespace junction::net
