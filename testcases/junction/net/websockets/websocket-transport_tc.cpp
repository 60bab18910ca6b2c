#include "stdinc.hpp"

#include "junction/net/websockets/websocket-transport.hpp"
#include "junction/portable/asio/asio-timer-factory.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace junction::net::test {

using namespace std::chrono_literals;

CATCH_TEST_CASE("WebsocketTransport", "[websocket-transport]") {
  boost::asio::io_context io_context;
  WebsocketTransport transport{io_context};

  CATCH_SECTION("unconnected") {
    CATCH_REQUIRE(!transport.is_open());
    CATCH_REQUIRE(transport.send_frame(make_send_buffer("hello"), FrameKind::TEXT) ==
                  make_error_code(ecode::not_connected));
    transport.close(); // Nothing to close
    CATCH_REQUIRE(!transport.is_open());
  }

  CATCH_SECTION("timers-run-on-the-connection-strand") {
    const auto strand = transport.get_executor();
    const auto make_timer = make_steady_timer_factory(strand);

    std::atomic<int> fired{0};
    std::atomic<int> on_strand{0};
    std::vector<boost::asio::steady_timer> timers;
    timers.reserve(4);
    for (int i = 0; i < 4; ++i) {
      timers.push_back(make_timer());
      timers.back().expires_after(1ms);
      timers.back().async_wait([&](const boost::system::error_code& ec) {
        if (ec)
          return;
        ++fired;
        if (strand.running_in_this_thread())
          ++on_strand;
      });
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i)
      threads.emplace_back([&io_context]() { io_context.run_for(200ms); });
    for (auto& thread : threads)
      thread.join();

    CATCH_REQUIRE(fired == 4);
    CATCH_REQUIRE(on_strand == 4);
  }
}

} // namespace junction::net::test
