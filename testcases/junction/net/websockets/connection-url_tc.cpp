#include "stdinc.hpp"

#include "junction/net/websockets/connection-url.hpp"

#include <catch2/catch.hpp>

namespace junction::net::test {

CATCH_TEST_CASE("ConnectionUrl", "[connection-url]") {
  CATCH_SECTION("make-connection-url") {
    CATCH_REQUIRE(make_connection_url(false, "localhost:8080", "") == "ws://localhost:8080");
    CATCH_REQUIRE(make_connection_url(true, "example.com/rpc", "") == "wss://example.com/rpc");
    CATCH_REQUIRE(make_connection_url(true, "example.com/rpc", "a b/c") ==
                  "wss://example.com/rpc?token=a%20b%2Fc");
    CATCH_REQUIRE(make_connection_url(false, "host/path?x=1", "t") ==
                  "ws://host/path?x=1&token=t");
  }

  CATCH_SECTION("parse-connection-url") {
    const auto plain = parse_connection_url("ws://localhost");
    CATCH_REQUIRE(plain.has_value());
    CATCH_REQUIRE(*plain == ConnectionTarget{false, "localhost", 80, "/"});

    const auto secure = parse_connection_url("wss://example.com/rpc/v1?token=abc");
    CATCH_REQUIRE(secure.has_value());
    CATCH_REQUIRE(*secure == ConnectionTarget{true, "example.com", 443, "/rpc/v1?token=abc"});

    const auto port = parse_connection_url("ws://127.0.0.1:9001?token=x");
    CATCH_REQUIRE(port.has_value());
    CATCH_REQUIRE(*port == ConnectionTarget{false, "127.0.0.1", 9001, "/?token=x"});

    const auto ipv6 = parse_connection_url("wss://[::1]:8443/ws");
    CATCH_REQUIRE(ipv6.has_value());
    CATCH_REQUIRE(*ipv6 == ConnectionTarget{true, "::1", 8443, "/ws"});

    const auto round_trip = parse_connection_url(make_connection_url(true, "h:1/p", "tok"));
    CATCH_REQUIRE(round_trip.has_value());
    CATCH_REQUIRE(*round_trip == ConnectionTarget{true, "h", 1, "/p?token=tok"});
  }

  CATCH_SECTION("parse-connection-url-errors") {
    CATCH_REQUIRE(parse_connection_url("http://host").error() ==
                  make_error_code(ecode::argument_error));
    CATCH_REQUIRE(parse_connection_url("host:80").error() ==
                  make_error_code(ecode::argument_error));
    for (const auto url : {"ws://", "ws:///path", "ws://host:", "ws://host:0", "ws://host:65536",
                           "ws://host:80x", "ws://[::1", "ws://[::1]x", "ws://:80"}) {
      CATCH_REQUIRE(parse_connection_url(url).error() == make_error_code(ecode::invalid_data));
    }
  }
}

} // namespace junction::net::test
