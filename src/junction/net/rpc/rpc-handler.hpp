#pragma once

#include "envelope.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace junction::net {

/**
 * @brief Serves requests routed to it, or receives the reply (or timeout) of a request it
 *        was registered for.
 *
 * Handlers are shared with the route trie and the pending-reply registry, never copied.
 */
class RpcHandler {
public:
  virtual ~RpcHandler() = default;

  /**
   * @return An envelope to send back to the peer, or `std::nullopt` for no reply.
   */
  virtual std::optional<Envelope> handle(const Envelope& request) = 0;
};

using RpcHandlerPtr = std::shared_ptr<RpcHandler>;

/**
 * @brief Adapts a function object to `RpcHandler`.
 */
class FunctionHandler final : public RpcHandler {
public:
  using FunctionType = std::function<std::optional<Envelope>(const Envelope& request)>;

private:
  FunctionType function_;

public:
  explicit FunctionHandler(FunctionType function) : function_{std::move(function)} {}

  std::optional<Envelope> handle(const Envelope& request) override {
    if (!function_)
      return std::nullopt;
    return function_(request);
  }
};

inline RpcHandlerPtr make_handler(FunctionHandler::FunctionType function) {
  return std::make_shared<FunctionHandler>(std::move(function));
}

} // namespace junction::net
