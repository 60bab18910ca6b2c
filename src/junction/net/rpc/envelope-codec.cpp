#include "stdinc.hpp"

#include "envelope-codec.hpp"

#include "junction/utils/string-utils.hpp"

namespace junction::net {

using json = nlohmann::json;

namespace {

// A single-key object keyed `$binary` or `$json` is a wrapper, never a user value
bool is_wrapper(const json& value) {
  return value.is_object() && value.size() == 1 &&
         (value.contains(field::k_binary) || value.contains(field::k_json));
}

// --------------------------------------------------------------------------------------- Encoders

json encode_payload(const Payload& payload, FrameKind kind) {
  return std::visit(
      [kind](const auto& value) -> json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, json>) {
          if (!value.is_null() && !is_wrapper(value))
            return value;
          json wrapped = json::object();
          wrapped[field::k_json] = value;
          return wrapped;
        } else if (kind == FrameKind::BINARY) {
          const auto ptr = reinterpret_cast<const uint8_t*>(value.data());
          return json::binary(json::binary_t::container_type(ptr, ptr + value.size()));
        } else {
          json wrapped = json::object();
          wrapped[field::k_binary] = encode_base64(to_span_bytes(value));
          return wrapped;
        }
      },
      payload);
}

json encode_document(const Envelope& envelope, FrameKind kind) {
  json params = json::object();
  for (const auto& [name, value] : envelope.params)
    params[name] = encode_payload(value, kind);

  json document = json::object();
  document[field::k_id] = envelope.id;
  document[field::k_status] = envelope.status;
  document[field::k_message] = envelope.message;
  document[field::k_route_key] = envelope.route_key;
  document[field::k_payload] = encode_payload(envelope.payload, kind);
  document[field::k_params] = std::move(params);
  return document;
}

// --------------------------------------------------------------------------------------- Decoders

tl::expected<Payload, std::error_code> decode_payload(const json& value, FrameKind kind) {
  if (value.is_null())
    return Payload{};

  if (value.is_binary()) {
    const auto& binary = value.get_binary();
    return Payload{std::in_place_type<BufferType>,
                   make_send_buffer(std::span<const uint8_t>{binary.data(), binary.size()})};
  }

  if (value.is_object() && value.size() == 1) {
    if (const auto ii = value.find(field::k_json); ii != value.end())
      return Payload{std::in_place_type<json>, *ii};

    const auto ii = value.find(field::k_binary);
    if (kind == FrameKind::TEXT && ii != value.end() && ii->is_string()) {
      auto bytes = decode_base64(ii->get_ref<const std::string&>());
      if (!bytes)
        return tl::make_unexpected(bytes.error());
      return Payload{std::in_place_type<BufferType>, std::move(*bytes)};
    }
  }

  return Payload{std::in_place_type<json>, value};
}

std::error_code decode_string(const json& document, const char* name, std::string& out) {
  const auto ii = document.find(name);
  if (ii == document.end() || ii->is_null())
    return {}; // Keep the default
  if (!ii->is_string())
    return make_error_code(ecode::type_error);
  out = ii->get<std::string>();
  return {};
}

std::error_code decode_status(const json& document, int32_t& out) {
  const auto ii = document.find(field::k_status);
  if (ii == document.end() || ii->is_null())
    return {};
  if (!ii->is_number_integer())
    return make_error_code(ecode::type_error);

  if (ii->is_number_unsigned()) {
    const auto value = ii->get<uint64_t>();
    if (value > uint64_t(std::numeric_limits<int32_t>::max()))
      return make_error_code(ecode::invalid_data);
    out = int32_t(value);
  } else {
    const auto value = ii->get<int64_t>();
    if (value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max())
      return make_error_code(ecode::invalid_data);
    out = int32_t(value);
  }
  return {};
}

std::error_code decode_params(const json& document, FrameKind kind, Params& out) {
  const auto ii = document.find(field::k_params);
  if (ii == document.end() || ii->is_null())
    return {};
  if (!ii->is_object())
    return make_error_code(ecode::type_error);

  for (auto jj = ii->begin(); jj != ii->end(); ++jj) {
    auto value = decode_payload(jj.value(), kind);
    if (!value)
      return value.error();
    out.insert_or_assign(jj.key(), std::move(*value));
  }
  return {};
}

tl::expected<Envelope, std::error_code> decode_document(const json& document, FrameKind kind) {
  if (!document.is_object())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));

  Envelope envelope;
  std::error_code ec;
  if ((ec = decode_string(document, field::k_id, envelope.id)) ||               // If any
      (ec = decode_status(document, envelope.status)) ||                        // field
      (ec = decode_string(document, field::k_message, envelope.message)) ||     // fails
      (ec = decode_string(document, field::k_route_key, envelope.route_key)) || // to decode
      (ec = decode_params(document, kind, envelope.params)))                    // then
    return tl::make_unexpected(ec);                                             // fail

  const auto ii = document.find(field::k_payload);
  if (ii != document.end()) {
    auto payload = decode_payload(*ii, kind);
    if (!payload)
      return tl::make_unexpected(payload.error());
    envelope.payload = std::move(*payload);
  }

  return envelope;
}

} // namespace

// ------------------------------------------------------------------------------------------ Encode

tl::expected<BufferType, std::error_code> encode_text(const Envelope& envelope) {
  try {
    return make_send_buffer(encode_document(envelope, FrameKind::TEXT).dump());
  } catch (const json::exception& e) {
    TRACE("failed to encode {} as json: {}", envelope.to_string(), e.what());
    return tl::make_unexpected(make_error_code(ecode::operation_failed));
  }
}

tl::expected<BufferType, std::error_code> encode_binary(const Envelope& envelope) {
  try {
    const auto bson = json::to_bson(encode_document(envelope, FrameKind::BINARY));
    return make_send_buffer(std::span<const uint8_t>{bson.data(), bson.size()});
  } catch (const json::exception& e) {
    TRACE("failed to encode {} as bson: {}", envelope.to_string(), e.what());
    return tl::make_unexpected(make_error_code(ecode::operation_failed));
  }
}

tl::expected<BufferType, std::error_code> encode(const Envelope& envelope, FrameKind kind) {
  return (kind == FrameKind::BINARY) ? encode_binary(envelope) : encode_text(envelope);
}

// ------------------------------------------------------------------------------------------ Decode

tl::expected<Envelope, std::error_code> decode_text(std::string_view text) {
  const auto document = json::parse(text.begin(), text.end(), nullptr, false);
  if (document.is_discarded())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  return decode_document(document, FrameKind::TEXT);
}

tl::expected<Envelope, std::error_code> decode_binary(std::span<const std::byte> data) {
  const auto ptr = reinterpret_cast<const uint8_t*>(data.data());
  const auto document = json::from_bson(ptr, ptr + data.size(), true, false);
  if (document.is_discarded())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  return decode_document(document, FrameKind::BINARY);
}

tl::expected<Envelope, std::error_code> decode(std::span<const std::byte> data, FrameKind kind) {
  return (kind == FrameKind::BINARY) ? decode_binary(data) : decode_text(to_string_view(data));
}

} // namespace junction::net
