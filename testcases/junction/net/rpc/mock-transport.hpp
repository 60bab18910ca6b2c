#pragma once

#include "junction/net/rpc/envelope-codec.hpp"
#include "junction/net/transport.hpp"

#include <stdexcept>
#include <vector>

namespace junction::net::test {

/**
 * @brief Records sent frames in memory.
 */
class MockTransport final : public Transport {
public:
  struct Frame {
    BufferType data;
    FrameKind kind;
  };

  bool open = true;
  std::vector<Frame> frames{};
  uint16_t close_code = 0;

  bool is_open() const override { return open; }

  std::error_code send_frame(BufferType&& buffer, FrameKind kind) override {
    if (!open)
      return make_error_code(ecode::not_connected);
    frames.push_back({std::move(buffer), kind});
    return {};
  }

  void close(uint16_t code, std::string_view) override {
    open = false;
    close_code = code;
  }

  /** @brief Decode a sent frame with the codec of its kind */
  Envelope envelope(std::size_t index) const {
    const auto& frame = frames.at(index);
    auto result = decode(to_span_bytes(frame.data), frame.kind);
    if (!result.has_value())
      throw std::runtime_error{
          fmt::format("failed to decode frame {}: {}", index, result.error().message())};
    return *result;
  }
};

} // namespace junction::net::test
