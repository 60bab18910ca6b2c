#pragma once

#include <cstdint>
#include <string_view>

namespace junction::net {

/**
 * @brief Envelope status codes the library itself produces. They follow the HTTP convention,
 *        but the wire carries any 32-bit integer.
 */
static constexpr int32_t k_status_ok = 200;
static constexpr int32_t k_status_request_timeout = 408;

static constexpr std::string_view k_request_timeout_message = "Request timeout";

} // namespace junction::net
