#include "stdinc.hpp"

#include "junction/net/rpc/route-trie.hpp"

#include <catch2/catch.hpp>

namespace junction::net::test {

static RpcHandlerPtr make_named_handler(std::string name) {
  return make_handler([name](const Envelope& request) -> std::optional<Envelope> {
    return make_reply(request, nlohmann::json(name));
  });
}

static std::string call(const RpcHandlerPtr& handler) {
  const auto reply = handler->handle(Envelope{});
  return std::get<nlohmann::json>(reply->payload).get<std::string>();
}

CATCH_TEST_CASE("RouteTrie", "[route-trie]") {
  CATCH_SECTION("insert-lookup") {
    RouteTrie trie;
    CATCH_REQUIRE(!trie.insert("a.b.c", make_named_handler("abc")));
    CATCH_REQUIRE(!trie.insert("a.x", make_named_handler("ax")));

    const auto abc = trie.lookup("a.b.c");
    CATCH_REQUIRE(abc.has_value());
    CATCH_REQUIRE(call(*abc) == "abc");
    CATCH_REQUIRE(call(*trie.lookup("a.x")) == "ax");

    // Intermediate nodes exist, but hold no handler
    const auto ab = trie.lookup("a.b");
    CATCH_REQUIRE(ab.has_value());
    CATCH_REQUIRE(*ab == nullptr);

    CATCH_REQUIRE(trie.lookup("a.b.c.d").error() == make_error_code(ecode::no_such_route));
    CATCH_REQUIRE(trie.lookup("b").error() == make_error_code(ecode::no_such_route));
    CATCH_REQUIRE(trie.root().size() == 1);
    CATCH_REQUIRE(trie.find("a")->size() == 2);
  }

  CATCH_SECTION("overwrite") {
    RouteTrie trie;
    CATCH_REQUIRE(!trie.insert("a.b", make_named_handler("first")));
    CATCH_REQUIRE(!trie.insert("a.b", make_named_handler("second")));
    CATCH_REQUIRE(call(*trie.lookup("a.b")) == "second");
    CATCH_REQUIRE(trie.find("a")->size() == 1);
  }

  CATCH_SECTION("empty-segments-are-names") {
    RouteTrie trie;
    CATCH_REQUIRE(!trie.insert("a..b", make_named_handler("empty")));
    CATCH_REQUIRE(call(*trie.lookup("a..b")) == "empty");
    CATCH_REQUIRE(!trie.lookup("a.b").has_value());
  }

  CATCH_SECTION("invalid-insert") {
    RouteTrie trie;
    CATCH_REQUIRE(trie.insert("", make_named_handler("root")) ==
                  make_error_code(ecode::argument_error));
    CATCH_REQUIRE(trie.insert("a", nullptr) == make_error_code(ecode::argument_error));
    CATCH_REQUIRE(trie.root().size() == 0);
    CATCH_REQUIRE(trie.root_handler() == nullptr);
  }

  CATCH_SECTION("root") {
    RouteTrie trie;
    const auto empty = trie.lookup("");
    CATCH_REQUIRE(empty.has_value());
    CATCH_REQUIRE(*empty == nullptr);

    trie.bind_root(make_named_handler("root"));
    CATCH_REQUIRE(call(*trie.lookup("")) == "root");
    CATCH_REQUIRE(!trie.remove(""));
    CATCH_REQUIRE(trie.root_handler() != nullptr);
  }

  CATCH_SECTION("remove-subtree") {
    RouteTrie trie;
    CATCH_REQUIRE(!trie.insert("a.b", make_named_handler("ab")));
    CATCH_REQUIRE(!trie.insert("a.b.c", make_named_handler("abc")));
    CATCH_REQUIRE(!trie.insert("a.d", make_named_handler("ad")));

    CATCH_REQUIRE(trie.remove("a.b"));
    CATCH_REQUIRE(!trie.lookup("a.b").has_value());
    CATCH_REQUIRE(!trie.lookup("a.b.c").has_value());
    CATCH_REQUIRE(call(*trie.lookup("a.d")) == "ad");

    CATCH_REQUIRE(!trie.remove("a.b"));
    CATCH_REQUIRE(!trie.remove("x.y"));
  }

  CATCH_SECTION("clear") {
    RouteTrie trie;
    trie.bind_root(make_named_handler("root"));
    CATCH_REQUIRE(!trie.insert("a", make_named_handler("a")));
    trie.clear();
    CATCH_REQUIRE(trie.root().size() == 0);
    CATCH_REQUIRE(call(trie.root_handler()) == "root");
  }
}

} // namespace junction::net::test
