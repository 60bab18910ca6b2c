#include "stdinc.hpp"

#include "mock-transport.hpp"

#include "junction/net/rpc/rpc-dispatcher.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

namespace junction::net::test {

using json = nlohmann::json;

static Envelope make_request(std::string id, std::string key, json payload = nullptr) {
  Envelope envelope;
  envelope.id = std::move(id);
  envelope.route_key = std::move(key);
  if (!payload.is_null())
    envelope.payload = Payload{std::in_place_type<json>, std::move(payload)};
  return envelope;
}

/**
 * @brief Records every envelope it handles, and never replies.
 */
struct RecordingHandler final : public RpcHandler {
  std::vector<Envelope> received{};

  std::optional<Envelope> handle(const Envelope& envelope) override {
    received.push_back(envelope);
    return std::nullopt;
  }
};

static RpcHandlerPtr make_echo_handler() {
  return make_handler([](const Envelope& request) -> std::optional<Envelope> {
    return make_reply(request, request.payload);
  });
}

CATCH_TEST_CASE("RpcDispatcher", "[rpc-dispatcher]") {
  MockTransport transport;
  RpcDispatcher dispatcher{transport, nullptr};

  CATCH_SECTION("serve-route") {
    dispatcher.add_route("math.echo", make_echo_handler());
    dispatcher.on_inbound_envelope(make_request("r1", "math.echo", json{{"x", 1}}));

    CATCH_REQUIRE(transport.frames.size() == 1);
    CATCH_REQUIRE(transport.frames[0].kind == FrameKind::TEXT);
    const auto reply = transport.envelope(0);
    CATCH_REQUIRE(reply.id == "r1");
    CATCH_REQUIRE(reply.route_key.empty());
    CATCH_REQUIRE(reply.status == 200);
    CATCH_REQUIRE(std::get<json>(reply.payload) == json{{"x", 1}});
  }

  CATCH_SECTION("handler-without-reply") {
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_route("log", handler);
    dispatcher.on_inbound_envelope(make_request("r1", "log"));
    CATCH_REQUIRE(handler->received.size() == 1);
    CATCH_REQUIRE(transport.frames.empty());
  }

  CATCH_SECTION("no-such-route") {
    dispatcher.add_route("a.b", make_echo_handler());
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_envelope(make_request("r1", "a.c")));
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_envelope(make_request("r2", "a.b.c")));
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_envelope(make_request("r3", "a"))); // no handler
    CATCH_REQUIRE(transport.frames.empty());
  }

  CATCH_SECTION("reply-delivered-once") {
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.send_with_callback(make_request("q1", "remote.op"), handler);
    CATCH_REQUIRE(transport.frames.size() == 1);
    CATCH_REQUIRE(transport.envelope(0).route_key == "remote.op");
    CATCH_REQUIRE(dispatcher.registry().contains("q1"));

    auto reply = make_request("q1", "", json("done"));
    dispatcher.on_inbound_envelope(reply);
    dispatcher.on_inbound_envelope(reply); // duplicate is dropped
    CATCH_REQUIRE(handler->received.size() == 1);
    CATCH_REQUIRE(handler->received[0] == reply);
    CATCH_REQUIRE(!dispatcher.registry().contains("q1"));
  }

  CATCH_SECTION("unmatched-reply") {
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_envelope(make_request("nobody", "")));
    CATCH_REQUIRE(transport.frames.empty());
  }

  CATCH_SECTION("callback-result-is-sent") {
    dispatcher.send_with_callback(
        make_request("q1", "remote.op"), make_handler([](const Envelope& reply) {
          return std::optional<Envelope>{make_request("ack-" + reply.id, "remote.ack")};
        }));
    dispatcher.on_inbound_envelope(make_request("q1", ""));
    CATCH_REQUIRE(transport.frames.size() == 2);
    CATCH_REQUIRE(transport.envelope(1).id == "ack-q1");
    CATCH_REQUIRE(transport.envelope(1).route_key == "remote.ack");
  }

  CATCH_SECTION("add-send-callback") {
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_send_callback("q7", handler);
    CATCH_REQUIRE(transport.frames.empty());
    dispatcher.on_inbound_envelope(make_request("q7", ""));
    CATCH_REQUIRE(handler->received.size() == 1);
  }

  CATCH_SECTION("null-callback") {
    dispatcher.send_with_callback(make_request("q1", "remote.op"), nullptr);
    CATCH_REQUIRE(transport.frames.empty());
    CATCH_REQUIRE(dispatcher.registry().size() == 0);
  }

  CATCH_SECTION("frame-kind") {
    dispatcher.send(make_request("t", "k"));
    dispatcher.send(make_request("b", "k"), true);
    CATCH_REQUIRE(transport.frames.size() == 2);
    CATCH_REQUIRE(transport.frames[0].kind == FrameKind::TEXT);
    CATCH_REQUIRE(transport.frames[1].kind == FrameKind::BINARY);
    CATCH_REQUIRE(transport.envelope(1).id == "b");

    MockTransport binary_transport;
    RpcDispatcher binary{binary_transport, nullptr, RpcDispatcher::Config{.prefer_binary = true}};
    binary.send(make_request("b", "k"));
    binary.send(make_request("t", "k"), false);
    CATCH_REQUIRE(binary_transport.frames[0].kind == FrameKind::BINARY);
    CATCH_REQUIRE(binary_transport.frames[1].kind == FrameKind::TEXT);
  }

  CATCH_SECTION("inbound-frame") {
    dispatcher.add_route("echo", make_echo_handler());
    for (const auto kind : {FrameKind::TEXT, FrameKind::BINARY}) {
      const auto frame = encode(make_request("f1", "echo", json{1, 2}), kind);
      CATCH_REQUIRE(frame.has_value());
      dispatcher.on_receive(to_span_bytes(*frame), kind);
    }
    CATCH_REQUIRE(transport.frames.size() == 2);
    CATCH_REQUIRE(std::get<json>(transport.envelope(0).payload) == json{1, 2});
    CATCH_REQUIRE(std::get<json>(transport.envelope(1).payload) == json{1, 2});
  }

  CATCH_SECTION("malformed-frame") {
    dispatcher.add_route("echo", make_echo_handler());
    const auto garbage = make_send_buffer("{ definitely not json");
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_frame(to_span_bytes(garbage), FrameKind::TEXT));
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_frame(to_span_bytes(garbage), FrameKind::BINARY));
    CATCH_REQUIRE(transport.frames.empty());
  }

  CATCH_SECTION("throwing-handler") {
    dispatcher.add_route("boom", make_handler([](const Envelope&) -> std::optional<Envelope> {
                           throw std::runtime_error{"boom"};
                         }));
    CATCH_REQUIRE_NOTHROW(dispatcher.on_inbound_envelope(make_request("r1", "boom")));
    CATCH_REQUIRE(transport.frames.empty());
  }

  CATCH_SECTION("close-then-send") {
    dispatcher.close();
    CATCH_REQUIRE(!dispatcher.is_open());
    CATCH_REQUIRE(transport.close_code == 1000);
    CATCH_REQUIRE_NOTHROW(dispatcher.send(make_request("late", "k")));
    CATCH_REQUIRE(transport.frames.empty());

    // Routes and pending requests are untouched
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_send_callback("q1", handler);
    dispatcher.on_inbound_envelope(make_request("q1", ""));
    CATCH_REQUIRE(handler->received.size() == 1);
  }

  CATCH_SECTION("invalid-routes") {
    dispatcher.add_route("", make_echo_handler());
    dispatcher.add_route("a", nullptr);
    dispatcher.remove_route("");
    CATCH_REQUIRE(dispatcher.routes().root().size() == 0);

    // The root still delivers replies
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_send_callback("q1", handler);
    dispatcher.on_inbound_envelope(make_request("q1", ""));
    CATCH_REQUIRE(handler->received.size() == 1);
  }

  CATCH_SECTION("remove-route") {
    dispatcher.add_route("a.b", make_echo_handler());
    dispatcher.remove_route("a");
    dispatcher.on_inbound_envelope(make_request("r1", "a.b"));
    CATCH_REQUIRE(transport.frames.empty());
  }
}

CATCH_TEST_CASE("RpcDispatcherTimeout", "[rpc-dispatcher]") {
  MockTransport transport;

  CATCH_SECTION("sweep-delivers-timeout") {
    RpcDispatcher dispatcher{transport, nullptr, RpcDispatcher::Config{.registry = {.ttl = 0ms}}};
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.send_with_callback(make_request("q1", "slow.op"), handler);
    CATCH_REQUIRE(dispatcher.registry().sweep_expired() == 1);

    CATCH_REQUIRE(handler->received.size() == 1);
    const auto& timeout = handler->received[0];
    CATCH_REQUIRE(timeout.id == "q1");
    CATCH_REQUIRE(timeout.status == 408);
    CATCH_REQUIRE(timeout.message == "Request timeout");
    CATCH_REQUIRE(!has_value(timeout.payload));

    // A late reply is dropped
    dispatcher.on_inbound_envelope(make_request("q1", ""));
    CATCH_REQUIRE(handler->received.size() == 1);
  }

  CATCH_SECTION("timeout-result-is-sent") {
    RpcDispatcher dispatcher{transport, nullptr, RpcDispatcher::Config{.registry = {.ttl = 0ms}}};
    dispatcher.add_send_callback("q1", make_handler([](const Envelope& timeout) {
                                   return std::optional<Envelope>{
                                       make_request("retry-" + timeout.id, "slow.op")};
                                 }));
    CATCH_REQUIRE(dispatcher.registry().sweep_expired() == 1);
    CATCH_REQUIRE(transport.frames.size() == 1);
    CATCH_REQUIRE(transport.envelope(0).id == "retry-q1");
  }

  CATCH_SECTION("timer-driven-sweep") {
    boost::asio::io_context io_context;
    RpcDispatcher dispatcher{
        transport, [&io_context]() { return boost::asio::steady_timer{io_context}; },
        RpcDispatcher::Config{.registry = {.ttl = 10ms, .sweep_interval = 20ms}}};
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.send_with_callback(make_request("q1", "slow.op"), handler);
    io_context.run_for(200ms);
    CATCH_REQUIRE(handler->received.size() == 1);
    CATCH_REQUIRE(handler->received[0].status == 408);
    dispatcher.shutdown();
  }

  CATCH_SECTION("shutdown-drops-pending") {
    RpcDispatcher dispatcher{transport, nullptr, RpcDispatcher::Config{.registry = {.ttl = 0ms}}};
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_send_callback("q1", handler);
    dispatcher.shutdown();
    CATCH_REQUIRE(dispatcher.registry().sweep_expired() == 0);
    CATCH_REQUIRE(handler->received.empty());
  }
}

} // namespace junction::net::test
