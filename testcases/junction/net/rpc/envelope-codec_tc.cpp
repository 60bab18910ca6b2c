#include "stdinc.hpp"

#include "junction/net/rpc/envelope-codec.hpp"

#include <catch2/catch.hpp>

namespace junction::net::test {

using json = nlohmann::json;

static Envelope make_test_envelope() {
  Envelope envelope;
  envelope.id = "3f2b8c1e-0000-4000-8000-000000000001";
  envelope.status = 404;
  envelope.message = "not here";
  envelope.route_key = "chat.room.join";
  envelope.payload = json{{"room", "lobby"}, {"count", 3}, {"tags", {"a", "b"}}};
  envelope.params.emplace("raw", make_send_buffer(std::string_view{"\x00\x01\x02\xff", 4}));
  envelope.params.emplace("user", json{{"name", "alice"}});
  envelope.params.emplace("empty", Payload{});
  return envelope;
}

// Structured values that share a wire shape with the absent payload or the bytes wrapper
static std::vector<Payload> make_lookalike_payloads() {
  return {Payload{std::in_place_type<json>, nullptr},
          Payload{std::in_place_type<json>, json{{"$binary", "aGVsbG8="}}},
          Payload{std::in_place_type<json>, json{{"$json", 1}}},
          Payload{std::in_place_type<json>, json{{"$json", nullptr}}}};
}

CATCH_TEST_CASE("EnvelopeCodec", "[envelope-codec]") {
  CATCH_SECTION("round-trip-text") {
    const auto envelope = make_test_envelope();
    const auto buffer = encode_text(envelope);
    CATCH_REQUIRE(buffer.has_value());
    const auto decoded = decode_text(to_string_view(to_span_bytes(*buffer)));
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(*decoded == envelope);

    for (const auto& payload : make_lookalike_payloads()) {
      Envelope lookalike;
      lookalike.payload = payload;
      lookalike.params.emplace("value", payload);
      const auto bytes = encode_text(lookalike);
      CATCH_REQUIRE(bytes.has_value());
      const auto result = decode_text(to_string_view(to_span_bytes(*bytes)));
      CATCH_REQUIRE(result.has_value());
      CATCH_REQUIRE(std::holds_alternative<json>(result->payload));
      CATCH_REQUIRE(std::holds_alternative<json>(result->params.at("value")));
      CATCH_REQUIRE(*result == lookalike);
    }
  }

  CATCH_SECTION("round-trip-binary") {
    const auto envelope = make_test_envelope();
    const auto buffer = encode_binary(envelope);
    CATCH_REQUIRE(buffer.has_value());
    const auto decoded = decode_binary(to_span_bytes(*buffer));
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(*decoded == envelope);

    for (const auto& payload : make_lookalike_payloads()) {
      Envelope lookalike;
      lookalike.payload = payload;
      lookalike.params.emplace("value", payload);
      const auto bytes = encode_binary(lookalike);
      CATCH_REQUIRE(bytes.has_value());
      const auto result = decode_binary(to_span_bytes(*bytes));
      CATCH_REQUIRE(result.has_value());
      CATCH_REQUIRE(std::holds_alternative<json>(result->payload));
      CATCH_REQUIRE(std::holds_alternative<json>(result->params.at("value")));
      CATCH_REQUIRE(*result == lookalike);
    }
  }

  CATCH_SECTION("round-trip-defaults") {
    for (const auto kind : {FrameKind::TEXT, FrameKind::BINARY}) {
      const auto buffer = encode(Envelope{}, kind);
      CATCH_REQUIRE(buffer.has_value());
      const auto decoded = decode(to_span_bytes(*buffer), kind);
      CATCH_REQUIRE(decoded.has_value());
      CATCH_REQUIRE(*decoded == Envelope{});
      CATCH_REQUIRE(decoded->status == 200);
      CATCH_REQUIRE(!has_value(decoded->payload));
    }
  }

  CATCH_SECTION("wire-field-names") {
    const auto buffer = encode_text(make_test_envelope());
    CATCH_REQUIRE(buffer.has_value());
    const auto document = json::parse(to_string_view(to_span_bytes(*buffer)));
    CATCH_REQUIRE(document.at("UUID") == "3f2b8c1e-0000-4000-8000-000000000001");
    CATCH_REQUIRE(document.at("status") == 404);
    CATCH_REQUIRE(document.at("message") == "not here");
    CATCH_REQUIRE(document.at("key") == "chat.room.join");
    CATCH_REQUIRE(document.at("request").at("room") == "lobby");
    CATCH_REQUIRE(document.at("params").at("raw").at("$binary") == "AAEC/w==");
    CATCH_REQUIRE(document.at("params").at("empty").is_null());
  }

  CATCH_SECTION("binary-payload-is-bson-binary") {
    Envelope envelope;
    envelope.payload = make_send_buffer(std::string_view{"bytes"});
    const auto buffer = encode_binary(envelope);
    CATCH_REQUIRE(buffer.has_value());
    const auto ptr = reinterpret_cast<const uint8_t*>(buffer->data());
    const auto document = json::from_bson(ptr, ptr + buffer->size());
    CATCH_REQUIRE(document.at("request").is_binary());
    CATCH_REQUIRE(document.at("request").get_binary().size() == 5);
  }

  CATCH_SECTION("missing-fields-are-defaults") {
    const auto decoded = decode_text(R"({"UUID": "abc", "request": [1, 2, 3]})");
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(decoded->id == "abc");
    CATCH_REQUIRE(decoded->status == 200);
    CATCH_REQUIRE(decoded->message.empty());
    CATCH_REQUIRE(decoded->route_key.empty());
    CATCH_REQUIRE(decoded->params.empty());
    CATCH_REQUIRE(std::get<json>(decoded->payload) == json::array({1, 2, 3}));

    const auto nulls = decode_text(R"({"UUID": null, "status": null, "params": null})");
    CATCH_REQUIRE(nulls.has_value());
    CATCH_REQUIRE(*nulls == Envelope{});
  }

  CATCH_SECTION("text-binary-wrapper") {
    const auto decoded = decode_text(R"({"request": {"$binary": "aGVsbG8="}})");
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(std::get<BufferType>(decoded->payload) == make_send_buffer("hello"));

    // Only a single-key object is a wrapper
    const auto other = decode_text(R"({"request": {"$binary": "aGVsbG8=", "x": 1}})");
    CATCH_REQUIRE(other.has_value());
    CATCH_REQUIRE(std::holds_alternative<json>(other->payload));

    CATCH_REQUIRE(!decode_text(R"({"request": {"$binary": "a*b="}})").has_value());

    // `$json` unwraps verbatim
    const auto escaped = decode_text(R"({"request": {"$json": {"$binary": "aGVsbG8="}}})");
    CATCH_REQUIRE(escaped.has_value());
    CATCH_REQUIRE(std::get<json>(escaped->payload) == json{{"$binary", "aGVsbG8="}});

    Envelope envelope;
    envelope.payload = Payload{std::in_place_type<json>, nullptr};
    const auto buffer = encode_text(envelope);
    CATCH_REQUIRE(buffer.has_value());
    const auto document = json::parse(to_string_view(to_span_bytes(*buffer)));
    CATCH_REQUIRE(document.at("request") == json{{"$json", nullptr}});
  }

  CATCH_SECTION("malformed") {
    CATCH_REQUIRE(decode_text("").error() == make_error_code(ecode::invalid_data));
    CATCH_REQUIRE(decode_text("{ not json").error() == make_error_code(ecode::invalid_data));
    CATCH_REQUIRE(decode_text("[1, 2]").error() == make_error_code(ecode::invalid_data));
    CATCH_REQUIRE(decode_text("\"string\"").error() == make_error_code(ecode::invalid_data));

    CATCH_REQUIRE(decode_text(R"({"UUID": 7})").error() == make_error_code(ecode::type_error));
    CATCH_REQUIRE(decode_text(R"({"status": "200"})").error() ==
                  make_error_code(ecode::type_error));
    CATCH_REQUIRE(decode_text(R"({"params": [1]})").error() == make_error_code(ecode::type_error));
    CATCH_REQUIRE(decode_text(R"({"status": 4294967296})").error() ==
                  make_error_code(ecode::invalid_data));

    const auto garbage = make_send_buffer(std::string_view{"\x05\x00\x00", 3});
    CATCH_REQUIRE(decode_binary(to_span_bytes(garbage)).error() ==
                  make_error_code(ecode::invalid_data));

    // A text frame is never decoded as bson, and vice versa
    const auto text = encode_text(make_test_envelope());
    CATCH_REQUIRE(text.has_value());
    CATCH_REQUIRE(!decode(to_span_bytes(*text), FrameKind::BINARY).has_value());
  }

  CATCH_SECTION("encode-failure") {
    Envelope envelope;
    envelope.message = "\xff\xfe invalid utf-8";
    const auto buffer = encode_text(envelope);
    CATCH_REQUIRE(!buffer.has_value());
    CATCH_REQUIRE(buffer.error() == make_error_code(ecode::operation_failed));
  }
}

} // namespace junction::net::test
