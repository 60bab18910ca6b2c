#include "stdinc.hpp"

#include "rpc-dispatcher.hpp"

#include "envelope-codec.hpp"

namespace junction::net {

namespace {

/**
 * @brief Bound at the root of the trie: delivers a reply to the handler waiting on its id.
 */
class RegistryReplyHandler final : public RpcHandler {
private:
  RpcDispatcher::Registry& registry_;

public:
  explicit RegistryReplyHandler(RpcDispatcher::Registry& registry) : registry_{registry} {}

  std::optional<Envelope> handle(const Envelope& reply) override {
    auto pending = registry_.take(reply.id);
    if (!pending.has_value() || *pending == nullptr) {
      TRACE("dropping reply to unknown (or expired) request '{}'", reply.id);
      return std::nullopt;
    }
    return (*pending)->handle(reply);
  }
};

} // namespace

// ------------------------------------------------------------------------------------ Construction

RpcDispatcher::RpcDispatcher(Transport& transport, Registry::SteadyTimerFactory timer_factory,
                             Config config)
    : transport_{transport}, config_{config},
      registry_{std::move(timer_factory),
                [this](const std::string& id, RpcHandlerPtr handler) {
                  on_expire_(id, std::move(handler));
                },
                config.registry} {
  routes_.bind_root(std::make_shared<RegistryReplyHandler>(registry_));
}

RpcDispatcher::RpcDispatcher(Transport& transport, Registry::SteadyTimerFactory timer_factory)
    : RpcDispatcher(transport, std::move(timer_factory), Config{}) {}

RpcDispatcher::~RpcDispatcher() { shutdown(); }

// ----------------------------------------------------------------------------------------- Inbound

void RpcDispatcher::on_inbound_envelope(const Envelope& envelope) {
  RpcHandlerPtr handler;
  {
    std::lock_guard lock{routes_padlock_};
    auto result = routes_.lookup(envelope.route_key);
    if (!result.has_value()) {
      LOG_ERR("no such route: '{}', request '{}'", envelope.route_key, envelope.id);
      return;
    }
    handler = std::move(*result);
  }

  if (handler == nullptr) {
    LOG_ERR("no handler bound at route '{}', request '{}'", envelope.route_key, envelope.id);
    return;
  }

  invoke_(*handler, envelope);
}

void RpcDispatcher::on_inbound_frame(std::span<const std::byte> data, FrameKind kind) {
  auto envelope = decode(data, kind);
  if (!envelope.has_value()) {
    LOG_ERR("failed to decode {} frame of {} bytes: {}", str(kind), data.size(),
            envelope.error().message());
    return;
  }
  on_inbound_envelope(*envelope);
}

// ------------------------------------------------------------------------------------------ Routes

void RpcDispatcher::add_route(std::string_view key, RpcHandlerPtr handler) {
  std::error_code ec;
  {
    std::lock_guard lock{routes_padlock_};
    ec = routes_.insert(key, std::move(handler));
  }
  if (ec)
    LOG_ERR("failed to add route '{}': {}", key, ec.message());
}

void RpcDispatcher::remove_route(std::string_view key) {
  if (key.empty()) {
    LOG_ERR("attempt to remove the root route");
    return;
  }
  bool removed = false;
  {
    std::lock_guard lock{routes_padlock_};
    removed = routes_.remove(key);
  }
  if (!removed)
    TRACE("route '{}' was not bound", key);
}

// ---------------------------------------------------------------------------------------- Outbound

void RpcDispatcher::send(const Envelope& envelope, std::optional<bool> use_binary) {
  if (!transport_.is_open()) {
    TRACE("transport closed, dropping {}", envelope.to_string());
    return;
  }

  const bool binary = use_binary.value_or(config_.prefer_binary);
  const auto kind = binary ? FrameKind::BINARY : FrameKind::TEXT;
  auto buffer = encode(envelope, kind);
  if (!buffer.has_value()) {
    LOG_ERR("failed to encode {}: {}", envelope.to_string(), buffer.error().message());
    return;
  }

  const auto ec = transport_.send_frame(std::move(*buffer), kind);
  if (ec)
    TRACE("failed to send {}: {}", envelope.to_string(), ec.message());
}

void RpcDispatcher::send_with_callback(const Envelope& envelope, RpcHandlerPtr handler,
                                       std::optional<bool> use_binary) {
  if (handler == nullptr) {
    LOG_ERR("send_with_callback requires a handler, request '{}' not sent", envelope.id);
    return;
  }
  registry_.set(envelope.id, std::move(handler));
  send(envelope, use_binary);
}

void RpcDispatcher::add_send_callback(const std::string& id, RpcHandlerPtr handler) {
  if (handler == nullptr) {
    LOG_ERR("add_send_callback requires a handler, request '{}'", id);
    return;
  }
  registry_.set(id, std::move(handler));
}

void RpcDispatcher::close() { transport_.close(); }

// ------------------------------------------------------------------------------- TransportListener

void RpcDispatcher::on_open() { INFO("connection open"); }

void RpcDispatcher::on_receive(std::span<const std::byte> payload, FrameKind kind) {
  on_inbound_frame(payload, kind);
}

void RpcDispatcher::on_close(uint16_t close_code, std::string_view reason) {
  INFO("connection closed, code={}, reason='{}'", close_code, reason);
}

void RpcDispatcher::on_error(TransportOperation operation, std::error_code ec) {
  LOG_ERR("transport error during {}: {}", str(operation), ec.message());
}

// ----------------------------------------------------------------------------------------- Private

void RpcDispatcher::on_expire_(const std::string& id, RpcHandlerPtr handler) {
  if (handler == nullptr)
    return;
  TRACE("request '{}' timed out", id);
  invoke_(*handler, make_timeout_envelope(id));
}

void RpcDispatcher::invoke_(RpcHandler& handler, const Envelope& envelope) {
  std::optional<Envelope> result;
  try {
    result = handler.handle(envelope);
  } catch (const std::exception& e) {
    LOG_ERR("handler for {} threw: {}", envelope.to_string(), e.what());
    return;
  }
  if (result.has_value())
    send(*result);
}

} // namespace junction::net
