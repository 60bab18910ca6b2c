#include "stdinc.hpp"

#include "rpc-client.hpp"

#include "junction/net/websockets/websocket-transport.hpp"
#include "junction/portable/asio/asio-execution-context.hpp"
#include "junction/portable/asio/asio-timer-factory.hpp"

#include <boost/asio/io_context.hpp>

namespace junction::net {

// ------------------------------------------------------------------------------------------- Pimpl

struct RpcClient::Pimpl {
  const Config config;
  const std::string url;

  boost::asio::io_context io_context;
  AsioExecutionContext execution_context;
  WebsocketTransport transport;
  std::shared_ptr<RpcDispatcher> dispatcher;

  explicit Pimpl(Config config_)
      : config{std::move(config_)},
        url{make_connection_url(config.secure, config.address, config.token)},
        execution_context{io_context, std::max<std::size_t>(1, config.thread_pool_size)},
        transport{io_context, WebsocketTransport::Config{.verify_peer = config.verify_peer}},
        dispatcher{std::make_shared<RpcDispatcher>(
            transport, make_steady_timer_factory(transport.get_executor()),
            RpcDispatcher::Config{.prefer_binary = config.prefer_binary,
                                  .registry = {.ttl = config.request_ttl,
                                               .sweep_interval = config.sweep_interval}})} {}

  ~Pimpl() {
    // Stop delivering callbacks before tearing anything down
    dispatcher->shutdown();
    transport.close();
    execution_context.stop();
  }
};

// --------------------------------------------------------------------------------------- RpcClient

RpcClient::RpcClient(Config config) : pimpl_{std::make_unique<Pimpl>(std::move(config))} {}

RpcClient::~RpcClient() = default;

const RpcClient::Config& RpcClient::config() const { return pimpl_->config; }

const std::string& RpcClient::url() const { return pimpl_->url; }

std::error_code RpcClient::connect() {
  auto target = parse_connection_url(pimpl_->url);
  if (!target.has_value()) {
    LOG_ERR("invalid connection url '{}': {}", pimpl_->url, target.error().message());
    return target.error();
  }

  const auto ec = pimpl_->transport.connect(*target, pimpl_->dispatcher);
  if (ec)
    return ec;

  pimpl_->execution_context.run();
  return {};
}

void RpcClient::close() { pimpl_->dispatcher->close(); }

bool RpcClient::is_open() const { return pimpl_->dispatcher->is_open(); }

void RpcClient::add_route(std::string_view key, RpcHandlerPtr handler) {
  pimpl_->dispatcher->add_route(key, std::move(handler));
}

void RpcClient::remove_route(std::string_view key) { pimpl_->dispatcher->remove_route(key); }

void RpcClient::send(const Envelope& envelope, std::optional<bool> use_binary) {
  pimpl_->dispatcher->send(envelope, use_binary);
}

void RpcClient::send_with_callback(const Envelope& envelope, RpcHandlerPtr handler,
                                   std::optional<bool> use_binary) {
  pimpl_->dispatcher->send_with_callback(envelope, std::move(handler), use_binary);
}

void RpcClient::add_send_callback(const std::string& id, RpcHandlerPtr handler) {
  pimpl_->dispatcher->add_send_callback(id, std::move(handler));
}

RpcDispatcher& RpcClient::dispatcher() { return *pimpl_->dispatcher; }

} // namespace junction::net
