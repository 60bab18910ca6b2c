#include "stdinc.hpp"

#include "connection-url.hpp"

#include <charconv>

namespace junction::net {

static constexpr std::string_view k_ws_scheme = "ws://";
static constexpr std::string_view k_wss_scheme = "wss://";

std::string make_connection_url(bool secure, std::string_view address, std::string_view token) {
  auto url = fmt::format("{}{}", (secure ? k_wss_scheme : k_ws_scheme), address);
  if (!token.empty()) {
    url += (address.find('?') == std::string_view::npos) ? "?token=" : "&token=";
    url += url_encode(token);
  }
  return url;
}

static tl::expected<uint16_t, std::error_code> parse_port(std::string_view port) {
  unsigned value = 0;
  const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || value == 0 ||
      value > std::numeric_limits<uint16_t>::max())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  return static_cast<uint16_t>(value);
}

tl::expected<ConnectionTarget, std::error_code> parse_connection_url(std::string_view url) {
  ConnectionTarget out;
  if (url.starts_with(k_wss_scheme)) {
    out.secure = true;
    url.remove_prefix(k_wss_scheme.size());
  } else if (url.starts_with(k_ws_scheme)) {
    url.remove_prefix(k_ws_scheme.size());
  } else {
    return tl::make_unexpected(make_error_code(ecode::argument_error));
  }
  out.port = out.secure ? k_default_wss_port : k_default_ws_port;

  // Split authority from target
  const auto pos = url.find_first_of("/?");
  auto authority = url.substr(0, pos);
  if (pos != std::string_view::npos) {
    const auto rest = url.substr(pos);
    out.target = (rest.front() == '/') ? std::string{rest} : fmt::format("/{}", rest);
  }

  // Host and optional port
  std::string_view port;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos)
      return tl::make_unexpected(make_error_code(ecode::invalid_data));
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':')
        return tl::make_unexpected(make_error_code(ecode::invalid_data));
      port = tail.substr(1);
      if (port.empty())
        return tl::make_unexpected(make_error_code(ecode::invalid_data));
    }
    authority = authority.substr(1, close - 1);
  } else {
    const auto colon = authority.find(':');
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
      if (port.empty())
        return tl::make_unexpected(make_error_code(ecode::invalid_data));
      authority = authority.substr(0, colon);
    }
  }

  if (authority.empty())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  out.host = std::string{authority};

  if (!port.empty()) {
    const auto value = parse_port(port);
    if (!value)
      return tl::make_unexpected(value.error());
    out.port = *value;
  }

  return out;
}

} // namespace junction::net
