#pragma once

#include "envelope.hpp"
#include "route-trie.hpp"
#include "rpc-handler.hpp"

#include "junction/async/timed-registry.hpp"
#include "junction/net/transport.hpp"

#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace junction::net {

/**
 * @brief Routes inbound envelopes to handlers, and matches replies to outstanding requests.
 *
 * An inbound envelope with a route key is served by the handler bound at that key in the route
 * trie. An inbound envelope without a route key is a reply: it is delivered (once) to the
 * handler registered with `send_with_callback` under the same id. A request that is not
 * answered within the registry's ttl has its handler invoked with a 408 "Request timeout"
 * envelope instead.
 *
 * Any envelope produced by a handler is sent back over the transport.
 */
class RpcDispatcher final : public TransportListener {
public:
  using Registry = async::TimedRegistry<std::string, RpcHandlerPtr>;

  struct Config {
    bool prefer_binary = false; //!< Default codec for `send`
    Registry::Config registry{};
  };

private:
  Transport& transport_;
  const Config config_;

  mutable std::mutex routes_padlock_;
  RouteTrie routes_;
  Registry registry_;

public:
  /**
   * @param transport Where envelopes are sent; must outlive the dispatcher.
   * @param timer_factory Drives the periodic sweep for timed out requests. May be empty, in
   *        which case the owner must call `registry().sweep_expired()`.
   */
  RpcDispatcher(Transport& transport, Registry::SteadyTimerFactory timer_factory,
                Config config);
  RpcDispatcher(Transport& transport, Registry::SteadyTimerFactory timer_factory);
  RpcDispatcher(const RpcDispatcher&) = delete;
  RpcDispatcher(RpcDispatcher&&) = delete;
  ~RpcDispatcher() override;
  RpcDispatcher& operator=(const RpcDispatcher&) = delete;
  RpcDispatcher& operator=(RpcDispatcher&&) = delete;

  //@{ Inbound
  void on_inbound_envelope(const Envelope& envelope);
  void on_inbound_frame(std::span<const std::byte> data, FrameKind kind);
  //@}

  //@{ Routes
  void add_route(std::string_view key, RpcHandlerPtr handler);
  void remove_route(std::string_view key);
  //@}

  //@{ Outbound
  /**
   * @brief Encode and send `envelope`, if the transport is open. Never throws.
   * @param use_binary Overrides `Config::prefer_binary`
   */
  void send(const Envelope& envelope, std::optional<bool> use_binary = std::nullopt);

  /**
   * @brief Register `handler` to receive the reply (or timeout) for `envelope.id`, then send.
   */
  void send_with_callback(const Envelope& envelope, RpcHandlerPtr handler,
                          std::optional<bool> use_binary = std::nullopt);

  /**
   * @brief Register `handler` to receive the reply (or timeout) for `id`, without sending.
   */
  void add_send_callback(const std::string& id, RpcHandlerPtr handler);
  //@}

  void close();
  bool is_open() const { return transport_.is_open(); }

  /**
   * @brief Stop the sweep, and drop all outstanding requests without calling their handlers.
   */
  void shutdown() { registry_.shutdown(); }

  const Config& config() const { return config_; }
  Registry& registry() { return registry_; }
  const Registry& registry() const { return registry_; }

  /**
   * @note The route trie is not threadsafe; don't modify routes while using the result.
   */
  const RouteTrie& routes() const { return routes_; }

  //@{ TransportListener
  void on_open() override;
  void on_receive(std::span<const std::byte> payload, FrameKind kind) override;
  void on_close(uint16_t close_code, std::string_view reason) override;
  void on_error(TransportOperation operation, std::error_code ec) override;
  //@}

private:
  void on_expire_(const std::string& id, RpcHandlerPtr handler);
  void invoke_(RpcHandler& handler, const Envelope& envelope);
};

} // namespace junction::net
