#include "stdinc.hpp"

#include "junction/async/timed-registry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

namespace junction::async::test {

using Registry = TimedRegistry<std::string, int>;

CATCH_TEST_CASE("TimedRegistry", "[timed-registry]") {
  std::vector<std::pair<std::string, int>> expired;
  auto on_expire = [&expired](const std::string& key, int value) {
    expired.emplace_back(key, value);
  };

  CATCH_SECTION("defaults") {
    Registry registry{nullptr, on_expire};
    CATCH_REQUIRE(registry.config().ttl == 120'000ms);
    CATCH_REQUIRE(registry.config().sweep_interval == 60'000ms);
  }

  CATCH_SECTION("set-get-take") {
    Registry registry{nullptr, on_expire};
    registry.set("a", 1);
    registry.set("b", 2);
    CATCH_REQUIRE(registry.size() == 2);
    CATCH_REQUIRE(registry.contains("a"));
    CATCH_REQUIRE(registry.get("a") == 1);
    CATCH_REQUIRE(registry.get("a") == 1); // get does not remove

    registry.set("a", 3); // replace
    CATCH_REQUIRE(registry.get("a") == 3);

    CATCH_REQUIRE(registry.take("a") == 3);
    CATCH_REQUIRE(!registry.take("a").has_value()); // one shot
    CATCH_REQUIRE(!registry.get("missing").has_value());

    registry.remove("b");
    registry.remove("b");
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(registry.sweep_expired() == 0);
    CATCH_REQUIRE(expired.empty());

    registry.set("b", 2);
    CATCH_REQUIRE(!registry.contains("b"));
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(!registry.get("b").has_value());
  }

  CATCH_SECTION("expiry") {
    Registry registry{nullptr, on_expire, Registry::Config{.ttl = 0ms}};
    registry.set("a", 1);
    registry.set("b", 2);
    CATCH_REQUIRE(registry.size() == 2);

    // Expired entries are evicted lazily, without the callback
    CATCH_REQUIRE(!registry.get("a").has_value());
    CATCH_REQUIRE(registry.size() == 1);

    // And by the sweep, with the callback
    CATCH_REQUIRE(registry.sweep_expired() == 1);
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(expired.size() == 1);
    CATCH_REQUIRE(expired[0].first == "b");
    CATCH_REQUIRE(expired[0].second == 2);
    CATCH_REQUIRE(registry.sweep_expired() == 0);
  }

  CATCH_SECTION("unexpired-entries-survive-sweep") {
    Registry registry{nullptr, on_expire, Registry::Config{.ttl = 60'000ms}};
    registry.set("a", 1);
    CATCH_REQUIRE(registry.sweep_expired() == 0);
    CATCH_REQUIRE(registry.take("a") == 1);
    CATCH_REQUIRE(expired.empty());
  }

  CATCH_SECTION("callback-may-reenter") {
    Registry* self = nullptr;
    Registry registry{nullptr,
                      [&](const std::string& key, int value) {
                        self->set(key + "-retry", value + 1); // Must not deadlock
                      },
                      Registry::Config{.ttl = 0ms}};
    self = &registry;
    registry.set("a", 1);
    CATCH_REQUIRE(registry.sweep_expired() == 1);
    CATCH_REQUIRE(registry.contains("a-retry"));
  }

  CATCH_SECTION("shutdown") {
    Registry registry{nullptr, on_expire, Registry::Config{.ttl = 0ms}};
    registry.set("a", 1);
    registry.shutdown();
    registry.shutdown();
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(registry.sweep_expired() == 0);
    CATCH_REQUIRE(expired.empty());

    registry.set("b", 2);
    CATCH_REQUIRE(!registry.contains("b"));
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(!registry.get("b").has_value());
  }

  CATCH_SECTION("periodic-sweep") {
    boost::asio::io_context io_context;
    Registry registry{[&io_context]() { return boost::asio::steady_timer{io_context}; }, on_expire,
                      Registry::Config{.ttl = 10ms, .sweep_interval = 20ms}};
    registry.set("a", 1);
    registry.set("b", 2);
    io_context.run_for(200ms);
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(expired.size() == 2);

    // Shutdown cancels the timer, so the io_context runs out of work
    registry.shutdown();
    io_context.restart();
    io_context.run_for(100ms);
    CATCH_REQUIRE(io_context.stopped());
  }

  CATCH_SECTION("sweep-on-strand") {
    boost::asio::io_context io_context;
    auto strand = boost::asio::make_strand(io_context);
    std::atomic<int> on_strand{0};
    std::atomic<int> calls{0};
    TimedRegistry<std::string, int> registry{
        [&strand]() { return boost::asio::steady_timer{strand}; },
        [&](const std::string&, int) {
          ++calls;
          if (strand.running_in_this_thread())
            ++on_strand;
        },
        Registry::Config{.ttl = 10ms, .sweep_interval = 20ms}};
    registry.set("a", 1);
    registry.set("b", 2);

    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i)
      threads.emplace_back([&io_context]() { io_context.run_for(200ms); });
    for (auto& thread : threads)
      thread.join();

    CATCH_REQUIRE(calls == 2);
    CATCH_REQUIRE(on_strand == 2);
    registry.shutdown();
  }

  CATCH_SECTION("concurrent-take") {
    Registry registry{nullptr, on_expire};
    registry.set("a", 1);
    std::atomic<int> taken{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
      threads.emplace_back([&]() {
        if (registry.take("a").has_value())
          ++taken;
      });
    for (auto& thread : threads)
      thread.join();
    CATCH_REQUIRE(taken == 1);
  }
}

} // namespace junction::async::test
