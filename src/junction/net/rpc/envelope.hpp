#pragma once

#include "status.hpp"

#include "junction/net/buffer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace junction::net {

/**
 * @brief An envelope body, or the value of a side-channel parameter.
 *
 * + `std::monostate` no value
 * + `nlohmann::json` a structured value
 * + `BufferType`     raw bytes
 */
using Payload = std::variant<std::monostate, nlohmann::json, BufferType>;

using Params = std::unordered_map<std::string, Payload>;

inline bool has_value(const Payload& payload) {
  return !std::holds_alternative<std::monostate>(payload);
}

/**
 * @brief The request/response unit exchanged over the connection.
 *
 * `id` is chosen by whoever sends a request, and is echoed in the reply. An envelope with an
 * empty `route_key` is a reply to an outstanding request; otherwise the route key selects the
 * handler that serves it.
 */
struct Envelope {
  std::string id{};               //!< Correlates replies with requests, wire name "UUID"
  int32_t status{k_status_ok};    //!< HTTP-like status code
  std::string message{};          //!< Human readable status text
  std::string route_key{};        //!< Dot-separated handler path, wire name "key"
  Payload payload{};              //!< Request or response body, wire name "request"
  Params params{};                //!< Side-channel parameters

  bool operator==(const Envelope& o) const = default;

  std::string to_string() const;
};

/**
 * @brief The envelope delivered to a pending callback when its request times out.
 */
Envelope make_timeout_envelope(std::string id);

/**
 * @brief A reply to `request`: same id, no route key (so it is matched against the peer's
 *        outstanding requests).
 */
Envelope make_reply(const Envelope& request, Payload payload, int32_t status = k_status_ok,
                    std::string message = "");

} // namespace junction::net
