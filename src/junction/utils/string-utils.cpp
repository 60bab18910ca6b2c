#include "base-include.hpp"

#include "string-utils.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <cctype>

namespace junction {

// ---------------------------------------------------------------------- base64

namespace base64 = boost::beast::detail::base64;

std::string encode_base64(std::span<const std::byte> data) {
  std::string out;
  out.resize(base64::encoded_size(data.size()));
  const auto written = base64::encode(out.data(), data.data(), data.size());
  out.resize(written);
  return out;
}

tl::expected<std::vector<std::byte>, std::error_code> decode_base64(std::string_view encoded) {
  if (encoded.size() % 4 != 0)
    return tl::make_unexpected(make_error_code(ecode::invalid_data));

  // Beast stops reading at the first '=', so strip (at most 2) padding characters first
  auto body = encoded;
  for (int i = 0; i < 2 && !body.empty() && body.back() == '='; ++i)
    body.remove_suffix(1);
  if (body.size() % 4 == 1)
    return tl::make_unexpected(make_error_code(ecode::invalid_data));

  std::vector<std::byte> out;
  out.resize(base64::decoded_size(encoded.size()));
  const auto [written, read] = base64::decode(out.data(), body.data(), body.size());
  if (read != body.size())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  out.resize(written);
  return out;
}

// ------------------------------------------------------------------ url encode

std::string url_encode(std::string_view value) {
  static constexpr char k_hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (const char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(k_hex[(c >> 4) & 0x0f]);
      out.push_back(k_hex[c & 0x0f]);
    }
  }
  return out;
}

} // namespace junction
