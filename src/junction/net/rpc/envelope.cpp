#include "stdinc.hpp"

#include "envelope.hpp"

namespace junction::net {

std::string Envelope::to_string() const {
  const char* payload_kind = std::holds_alternative<std::monostate>(payload) ? "none"
                             : std::holds_alternative<BufferType>(payload)   ? "bytes"
                                                                             : "json";
  return fmt::format(
      "Envelope(id='{}', status={}, message='{}', key='{}', payload={}, #params={})", id, status,
      message, route_key, payload_kind, params.size());
}

Envelope make_timeout_envelope(std::string id) {
  Envelope envelope;
  envelope.id = std::move(id);
  envelope.status = k_status_request_timeout;
  envelope.message = std::string{k_request_timeout_message};
  return envelope;
}

Envelope make_reply(const Envelope& request, Payload payload, int32_t status,
                    std::string message) {
  Envelope envelope;
  envelope.id = request.id;
  envelope.status = status;
  envelope.message = std::move(message);
  envelope.payload = std::move(payload);
  return envelope;
}

} // namespace junction::net
