#include "stdinc.hpp"

#include "junction/utils/string-utils.hpp"

#include <catch2/catch.hpp>

namespace junction::test {

static std::vector<std::byte> to_bytes(std::string_view s) {
  const auto ptr = reinterpret_cast<const std::byte*>(s.data());
  return {ptr, ptr + s.size()};
}

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("explode") {
    CATCH_REQUIRE(explode("", '.').size() == 1);

    const auto parts = explode("one.two..three.", '.');
    CATCH_REQUIRE(parts.size() == 5);
    CATCH_REQUIRE(parts[0] == "one");
    CATCH_REQUIRE(parts[1] == "two");
    CATCH_REQUIRE(parts[2] == "");
    CATCH_REQUIRE(parts[3] == "three");
    CATCH_REQUIRE(parts[4] == "");
  }

  CATCH_SECTION("base64") {
    CATCH_REQUIRE(encode_base64(to_bytes("")) == "");
    CATCH_REQUIRE(encode_base64(to_bytes("hello")) == "aGVsbG8=");
    CATCH_REQUIRE(encode_base64(to_bytes("hell")) == "aGVsbA==");
    CATCH_REQUIRE(encode_base64(to_bytes("hel")) == "aGVs");

    for (const auto s : {"", "h", "he", "hel", "hell", "hello"}) {
      const auto decoded = decode_base64(encode_base64(to_bytes(s)));
      CATCH_REQUIRE(decoded.has_value());
      CATCH_REQUIRE(*decoded == to_bytes(s));
    }
  }

  CATCH_SECTION("base64-invalid") {
    CATCH_REQUIRE(!decode_base64("aGVsbG8").has_value());  // length
    CATCH_REQUIRE(!decode_base64("aGV*bG8=").has_value()); // alphabet
    CATCH_REQUIRE(!decode_base64("a===").has_value());     // too much padding
    CATCH_REQUIRE(decode_base64("aGV*bG8=").error() == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("url-encode") {
    CATCH_REQUIRE(url_encode("") == "");
    CATCH_REQUIRE(url_encode("abc-XYZ_0.9~") == "abc-XYZ_0.9~");
    CATCH_REQUIRE(url_encode("a b&c=d/e") == "a%20b%26c%3Dd%2Fe");
    CATCH_REQUIRE(url_encode("\xff") == "%FF");
  }
}

} // namespace junction::test
