#pragma once

#include "envelope.hpp"

#include "junction/net/buffer.hpp"

#include <tl/expected.hpp>

#include <span>
#include <string_view>
#include <system_error>

/**
 * Two wire representations of the same envelope schema:
 *
 * + TEXT   a json document
 * + BINARY a bson document
 *
 * Field names on the wire: `UUID`, `status`, `message`, `key`, `request`, `params`.
 * Missing (or null) fields decode to the envelope defaults. A field that is present with the
 * wrong type is an error, as is anything that is not a document.
 *
 * Raw-byte payloads are bson binary in the binary form, and `{"$binary": "<base64>"}` in the
 * text form. A null wire value is the absent payload, so a structured json null is written as
 * `{"$json": null}`. Likewise a structured value that would read back as a wrapper (a single-key
 * object keyed `$binary` or `$json`) is itself wrapped in `{"$json": ...}`. Every payload
 * therefore decodes to the alternative it was encoded from.
 */
namespace junction::net {

namespace field {
  static constexpr const char* k_id = "UUID";
  static constexpr const char* k_status = "status";
  static constexpr const char* k_message = "message";
  static constexpr const char* k_route_key = "key";
  static constexpr const char* k_payload = "request";
  static constexpr const char* k_params = "params";
  static constexpr const char* k_binary = "$binary";
  static constexpr const char* k_json = "$json";
} // namespace field

/**
 * @return The json text, or `ecode::operation_failed` if the envelope holds a value that json
 *         cannot represent (e.g., invalid utf-8).
 */
tl::expected<BufferType, std::error_code> encode_text(const Envelope& envelope);

/**
 * @return The bson document, or `ecode::operation_failed` if bson cannot represent a value.
 */
tl::expected<BufferType, std::error_code> encode_binary(const Envelope& envelope);

tl::expected<BufferType, std::error_code> encode(const Envelope& envelope, FrameKind kind);

tl::expected<Envelope, std::error_code> decode_text(std::string_view text);

tl::expected<Envelope, std::error_code> decode_binary(std::span<const std::byte> data);

/**
 * @brief Decode a received frame with the codec selected by `kind`.
 */
tl::expected<Envelope, std::error_code> decode(std::span<const std::byte> data, FrameKind kind);

} // namespace junction::net
