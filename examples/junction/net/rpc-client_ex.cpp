
#include "stdinc.hpp"

#include "junction/net/rpc/rpc-client.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstdlib>
#include <future>
#include <thread>

namespace junction::example {

using json = nlohmann::json;

static std::string make_request_id() {
  static thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

// ------------------------------------------------------------------------------ run-rpc-client

static int run_rpc_client(int argc, char** argv) {
  net::RpcClient::Config config;
  config.address = (argc > 1) ? argv[1] : "localhost:8080";
  config.secure = (argc > 2) && std::string_view{argv[2]} == "wss";
  config.token = (argc > 3) ? argv[3] : "";
  config.request_ttl = 5000ms;
  config.sweep_interval = 1000ms;

  net::RpcClient client{config};

  // Requests from the server
  client.add_route("client.ping", net::make_handler([](const net::Envelope& request) {
                     INFO("ping from server, id={}", request.id);
                     return std::optional<net::Envelope>{
                         net::make_reply(request, json{{"pong", true}})};
                   }));

  if (const auto ec = client.connect()) {
    LOG_ERR("failed to connect to {}: {}", client.url(), ec.message());
    return EXIT_FAILURE;
  }
  INFO("connecting to {}", client.url());

  // Wait for the connection
  for (int i = 0; i < 50 && !client.is_open(); ++i)
    std::this_thread::sleep_for(100ms);
  if (!client.is_open()) {
    LOG_ERR("timed out connecting to {}", client.url());
    return EXIT_FAILURE;
  }

  // Send a request, and wait for the reply (or timeout)
  std::promise<net::Envelope> promise;
  auto future = promise.get_future();

  net::Envelope request;
  request.id = make_request_id();
  request.route_key = "server.echo";
  request.payload = net::Payload{std::in_place_type<json>, json{{"hello", "world"}}};
  client.send_with_callback(request,
                            net::make_handler([&promise](const net::Envelope& reply) {
                              promise.set_value(reply);
                              return std::optional<net::Envelope>{};
                            }));

  const auto reply = future.get();
  INFO("reply: {}", reply.to_string());
  client.close();

  return (reply.status == net::k_status_ok) ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace junction::example

int main(int argc, char** argv) { return junction::example::run_rpc_client(argc, argv); }
