#include "stdinc.hpp"

#include "websocket-transport.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <type_traits>

namespace junction::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;

// ------------------------------------------------------------------------------------- SessionBase

class SessionBase {
public:
  virtual ~SessionBase() = default;
  virtual bool is_open() const = 0;
  virtual void send(BufferType&& buffer, FrameKind kind) = 0;
  virtual void close(uint16_t close_code, std::string_view reason) = 0;
};

// ----------------------------------------------------------------------------------- ClientSession

template <typename Stream>
class ClientSession final : public SessionBase,
                            public std::enable_shared_from_this<ClientSession<Stream>> {
private:
  static constexpr bool is_ssl = !std::is_same_v<Stream, beast::tcp_stream>;

  struct WriteItem {
    BufferType data;
    FrameKind kind;
  };

  beast::websocket::stream<Stream> ws_;
  asio::ip::tcp::resolver resolver_;
  beast::flat_buffer buffer_;
  std::weak_ptr<TransportListener> listener_;
  WebsocketTransport::Config config_;

  std::string host_;
  uint16_t port_{0};
  std::string target_;

  std::deque<WriteItem> write_queue_; //! Only touched on the strand
  std::atomic<bool> is_open_{false};
  std::atomic<bool> close_notified_{false};

public:
  template <typename... Args>
  ClientSession(const WebsocketTransport::StrandType& strand,
                std::weak_ptr<TransportListener> listener, WebsocketTransport::Config config,
                Args&&... args)
      : ws_{strand, std::forward<Args>(args)...},
        resolver_{ws_.get_executor()}, listener_{std::move(listener)}, config_{config} {}

  bool is_open() const override { return is_open_.load(std::memory_order_acquire); }

  // @{ Connecting
  void connect(const ConnectionTarget& target) {
    host_ = target.host;
    port_ = target.port;
    target_ = target.target;
    asio::post(ws_.get_executor(), [self = this->shared_from_this()]() {
      self->resolver_.async_resolve(
          self->host_, std::to_string(self->port_),
          beast::bind_front_handler(&ClientSession::on_resolve_, self));
    });
  }

private:
  void on_resolve_(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      on_error_(TransportOperation::CONNECT, ec);
      return;
    }

    beast::get_lowest_layer(ws_).expires_after(config_.handshake_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&ClientSession::on_connect_, this->shared_from_this()));
  }

  void on_connect_(beast::error_code ec, asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
      on_error_(TransportOperation::CONNECT, ec);
      return;
    }

    // Host HTTP header during the websocket handshake
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    const auto sni_host = host_;
    host_ += ':' + std::to_string(ep.port());

    if constexpr (is_ssl) {
      beast::get_lowest_layer(ws_).expires_after(config_.handshake_timeout);

      // Set SNI Hostname (many hosts need this to handshake successfully)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
      const bool set_tls_successful =
          SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), sni_host.c_str());
#pragma GCC diagnostic pop
      if (!set_tls_successful) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()};
        on_error_(TransportOperation::HANDSHAKE, ec);
        return;
      }

      if (config_.verify_peer) {
        ws_.next_layer().set_verify_mode(asio::ssl::verify_peer);
        ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification(sni_host));
      } else {
        ws_.next_layer().set_verify_mode(asio::ssl::verify_none);
      }

      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::client,
          beast::bind_front_handler(&ClientSession::on_tls_handshake_, this->shared_from_this()));
    } else {
      on_tls_handshake_(ec);
    }
  }

  void on_tls_handshake_(beast::error_code ec) {
    if (ec) {
      on_error_(TransportOperation::HANDSHAKE, ec);
      return;
    }

    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();

    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  std::string{BOOST_BEAST_VERSION_STRING} + " junction-rpc-client");
        }));

    ws_.async_handshake(
        host_, target_,
        beast::bind_front_handler(&ClientSession::on_handshake_, this->shared_from_this()));
  }

  void on_handshake_(beast::error_code ec) {
    if (ec) {
      on_error_(TransportOperation::HANDSHAKE, ec);
      return;
    }

    is_open_.store(true, std::memory_order_release);
    TRACE("websocket open, host={}, target={}", host_, target_);
    if (auto listener = listener_.lock())
      listener->on_open();

    do_read_();
  }
  // @}

  // @{ Reading
  void do_read_() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&ClientSession::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // This indicates that the session was closed
    if (ec == beast::websocket::error::closed) {
      const auto& reason = ws_.reason();
      notify_close_(reason.code, std::string_view{reason.reason.data(), reason.reason.size()});
      return;
    }

    if (ec) {
      on_error_(TransportOperation::READ, ec);
      return;
    }

    const auto kind = ws_.got_text() ? FrameKind::TEXT : FrameKind::BINARY;
    const auto data = buffer_.cdata();
    if (auto listener = listener_.lock()) {
      try {
        listener->on_receive({static_cast<const std::byte*>(data.data()), data.size()}, kind);
      } catch (const std::exception& e) {
        LOG_ERR("callback `on_receive` threw: {}", e.what());
      }
    }

    buffer_.consume(buffer_.size());
    do_read_();
  }
  // @}

  // @{ Writing
public:
  void send(BufferType&& buffer, FrameKind kind) override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this(), buffer = std::move(buffer), kind]() mutable {
                 if (!self->is_open())
                   return;
                 self->write_queue_.push_back({std::move(buffer), kind});
                 if (self->write_queue_.size() == 1) // Otherwise a write is in flight
                   self->do_write_();
               });
  }

private:
  void do_write_() {
    auto& item = write_queue_.front();
    ws_.text(item.kind == FrameKind::TEXT);
    ws_.async_write(asio::buffer(item.data.data(), item.data.size()),
                    beast::bind_front_handler(&ClientSession::on_write_, this->shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (ec) {
      write_queue_.clear();
      if (auto listener = listener_.lock())
        listener->on_error(TransportOperation::WRITE, ec);
      return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty())
      do_write_();
  }
  // @}

  // @{ Closing
public:
  void close(uint16_t close_code, std::string_view reason) override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), close_code,
                                    reason = std::string{reason}]() {
      if (!self->ws_.is_open()) {
        // Still connecting: abort outstanding operations
        self->is_open_.store(false, std::memory_order_release);
        beast::get_lowest_layer(self->ws_).cancel();
        return;
      }
      self->is_open_.store(false, std::memory_order_release);
      const auto close_reason = beast::websocket::close_reason{
          beast::websocket::close_code{close_code},
          beast::string_view{reason.data(), reason.size()}};
      self->ws_.async_close(close_reason, [self, close_code, reason](beast::error_code ec) {
        if (ec && ec != beast::websocket::error::closed) {
          self->on_error_(TransportOperation::CLOSE, ec);
          return;
        }
        self->notify_close_(close_code, reason);
      });
    });
  }

private:
  void notify_close_(uint16_t close_code, std::string_view reason) {
    is_open_.store(false, std::memory_order_release);
    if (close_notified_.exchange(true))
      return;
    if (auto listener = listener_.lock())
      listener->on_close(close_code, reason);
  }

  void on_error_(TransportOperation operation, std::error_code ec) {
    is_open_.store(false, std::memory_order_release);
    if (close_notified_.load())
      return; // Outstanding operations failing after a close
    if (auto listener = listener_.lock())
      listener->on_error(operation, ec);
  }
  // @}
};

} // namespace junction::net::detail

namespace junction::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

// ---------------------------------------------------------------------------------- Pimpl

struct WebsocketTransport::Pimpl {
  const StrandType strand;
  const Config config;
  asio::ssl::context ssl_context{asio::ssl::context::tlsv12_client};

  mutable std::mutex padlock;
  std::shared_ptr<detail::SessionBase> session; //! Set once, by `connect`

  Pimpl(asio::io_context& ioc, Config config_) : strand{asio::make_strand(ioc)}, config{config_} {
    beast::error_code ec;
    ssl_context.set_default_verify_paths(ec);
    if (ec)
      WARN("failed to load the default certificate paths: {}", ec.message());
  }

  std::shared_ptr<detail::SessionBase> get_session() const {
    std::lock_guard lock{padlock};
    return session;
  }
};

// --------------------------------------------------------------------------- WebsocketTransport

WebsocketTransport::WebsocketTransport(asio::io_context& io_context, Config config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)} {}

WebsocketTransport::WebsocketTransport(asio::io_context& io_context)
    : WebsocketTransport(io_context, Config{}) {}

WebsocketTransport::~WebsocketTransport() = default;

std::error_code WebsocketTransport::connect(const ConnectionTarget& target,
                                            std::weak_ptr<TransportListener> listener) {
  std::lock_guard lock{pimpl_->padlock};
  if (pimpl_->session != nullptr)
    return make_error_code(ecode::already_connected);

  INFO("connecting to {}://{}:{}{}", (target.secure ? "wss" : "ws"), target.host, target.port,
       target.target);

  if (target.secure) {
    auto session = std::make_shared<detail::ClientSession<beast::ssl_stream<beast::tcp_stream>>>(
        pimpl_->strand, std::move(listener), pimpl_->config, pimpl_->ssl_context);
    session->connect(target);
    pimpl_->session = std::move(session);
  } else {
    auto session = std::make_shared<detail::ClientSession<beast::tcp_stream>>(
        pimpl_->strand, std::move(listener), pimpl_->config);
    session->connect(target);
    pimpl_->session = std::move(session);
  }
  return {};
}

WebsocketTransport::StrandType WebsocketTransport::get_executor() const { return pimpl_->strand; }

bool WebsocketTransport::is_open() const {
  auto session = pimpl_->get_session();
  return session != nullptr && session->is_open();
}

std::error_code WebsocketTransport::send_frame(BufferType&& buffer, FrameKind kind) {
  auto session = pimpl_->get_session();
  if (session == nullptr || !session->is_open())
    return make_error_code(ecode::not_connected);
  session->send(std::move(buffer), kind);
  return {};
}

void WebsocketTransport::close(uint16_t close_code, std::string_view reason) {
  auto session = pimpl_->get_session();
  if (session != nullptr)
    session->close(close_code, reason);
}

} // namespace junction::net
