#pragma once

#include "error-codes.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup junction-strings Strings
 * @ingroup junction-utils
 */
namespace junction {

// --------------------------------------------------------------------- explode

/**
 * @ingroup junction-strings
 * @brief Split `input` on every `delim`. Empty parts are kept, so `explode("", '.')`
 *        has exactly one (empty) element.
 */
template <typename Container = std::vector<std::string_view>>
inline Container explode(std::string_view input, char delim) {
  Container out;
  auto start = std::begin(input);

  std::string_view::size_type pos0 = 0;
  while (true) {
    auto pos1 = input.find_first_of(delim, pos0);
    auto len = (pos1 == std::string_view::npos) ? input.size() - pos0 : pos1 - pos0;
    out.emplace_back(start + pos0, start + pos0 + len);
    if (pos1 == std::string_view::npos) {
      break;
    }
    pos0 = pos1 + 1;
  }

  return out;
}

// ---------------------------------------------------------------------- base64

/**
 * @ingroup junction-strings
 * @brief Padded base64 encoding of `data`.
 */
std::string encode_base64(std::span<const std::byte> data);

/**
 * @ingroup junction-strings
 * @brief Decode padded base64. Fails with `ecode::invalid_data` on any character outside of
 *        the base64 alphabet, or a length that is not a multiple of 4.
 */
tl::expected<std::vector<std::byte>, std::error_code> decode_base64(std::string_view encoded);

// ------------------------------------------------------------------ url encode

/**
 * @ingroup junction-strings
 * @brief Percent encode everything except RFC3986 unreserved characters.
 */
std::string url_encode(std::string_view value);

} // namespace junction
