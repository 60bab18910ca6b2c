#pragma once

#include "rpc-dispatcher.hpp"

#include "junction/async/timed-registry.hpp"
#include "junction/net/websockets/connection-url.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace junction::net {

/**
 * @brief A websocket rpc client: a `WebsocketTransport` and an `RpcDispatcher`, running on
 *        their own io_context and thread pool.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto client = RpcClient{RpcClient::Config{.secure = true, .address = "example.com/rpc"}};
 * client.add_route("chat.join", make_handler([](const Envelope& request) { ... }));
 * client.connect();
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class RpcClient {
public:
  struct Config {
    bool secure = false;          //!< wss:// instead of ws://
    std::string address{};        //!< host[:port][/path]
    std::string token{};          //!< Sent as the url query parameter `token`, if non-empty
    bool prefer_binary = false;   //!< Default codec for sends: bson (binary), or json (text)
    std::chrono::milliseconds request_ttl{async::k_default_ttl};
    std::chrono::milliseconds sweep_interval{async::k_default_sweep_interval};
    std::size_t thread_pool_size = 1; //!< Handlers stay serialized on the connection's strand
    bool verify_peer = true;          //!< Verify the server certificate (wss only)
  };

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  explicit RpcClient(Config config);
  RpcClient(const RpcClient&) = delete;
  RpcClient(RpcClient&&) = delete;
  ~RpcClient();
  RpcClient& operator=(const RpcClient&) = delete;
  RpcClient& operator=(RpcClient&&) = delete;

  const Config& config() const;

  /** @brief The url that `connect` connects to */
  const std::string& url() const;

  /**
   * @brief Start the thread pool, and begin connecting. Returns immediately.
   * @return `ecode::invalid_data` if the configured address is not a valid url authority,
   *         or `ecode::already_connected` if `connect` was called before.
   */
  std::error_code connect();

  /**
   * @brief Close the connection. Outstanding requests still time out.
   */
  void close();
  bool is_open() const;

  //@{ Forwarded to the dispatcher
  void add_route(std::string_view key, RpcHandlerPtr handler);
  void remove_route(std::string_view key);
  void send(const Envelope& envelope, std::optional<bool> use_binary = std::nullopt);
  void send_with_callback(const Envelope& envelope, RpcHandlerPtr handler,
                          std::optional<bool> use_binary = std::nullopt);
  void add_send_callback(const std::string& id, RpcHandlerPtr handler);
  //@}

  RpcDispatcher& dispatcher();
};

} // namespace junction::net
