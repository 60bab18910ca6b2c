#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace junction::net {

using BufferType = std::vector<std::byte>;

/**
 * @brief How a frame was (or will be) represented on the wire. The codec is always picked by
 *        the frame kind, never by sniffing the content.
 */
enum class FrameKind : uint8_t { TEXT, BINARY };

constexpr std::string_view str(FrameKind kind) {
  return (kind == FrameKind::TEXT) ? "TEXT" : "BINARY";
}

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.data() + buffer.size()};
}

inline std::string_view to_string_view(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

inline BufferType make_send_buffer(std::span<const std::byte> ss) {
  return BufferType{ss.begin(), ss.end()};
}

inline BufferType make_send_buffer(std::span<const uint8_t> ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

} // namespace junction::net
