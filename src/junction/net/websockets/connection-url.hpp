#pragma once

#include <tl/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace junction::net {

static constexpr uint16_t k_default_ws_port = 80;
static constexpr uint16_t k_default_wss_port = 443;

/**
 * @brief Where a websocket client connects to: `ws[s]://host[:port][target]`
 */
struct ConnectionTarget {
  bool secure = false;
  std::string host{};
  uint16_t port = k_default_ws_port;
  std::string target{"/"}; //!< Path and query, always starts with '/'

  bool operator==(const ConnectionTarget&) const = default;
};

/**
 * @brief Build the url `ws[s]://<address>[?token=<token>]`.
 * @param address `host[:port][/path]`
 * @param token Bearer token, url-encoded into the query string. Omitted if empty.
 */
std::string make_connection_url(bool secure, std::string_view address, std::string_view token);

/**
 * @brief Split a `ws://` or `wss://` url into host, port, and request target. IPv6 hosts are
 *        written in brackets, e.g., `ws://[::1]:8080/`.
 * @return `ecode::argument_error` for any other scheme, and `ecode::invalid_data` for an empty
 *         host or a bad port.
 */
tl::expected<ConnectionTarget, std::error_code> parse_connection_url(std::string_view url);

} // namespace junction::net
