#include <escrow/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace escrow::schema {

namespace {

inline constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
inline constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> hex_value(const char digit) {
  if (digit >= '0' && digit <= '9') {
    return static_cast<uint8_t>(digit - '0');
  }
  const auto lower = static_cast<char>(digit | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return static_cast<uint8_t>(lower - 'a' + 10);
  }
  return std::nullopt;
}

// Emits the sextets of one big-endian group of up to three bytes.
void append_base64_group(std::string& out,
                         const bytes_view_t& group) {
  auto packed = uint32_t{};
  for (std::size_t i = 0; i < 3; ++i) {
    packed <<= 8u;
    if (i < group.size()) {
      packed |= group[i];
    }
  }
  for (std::size_t i = 0; i < 4; ++i) {
    if (i <= group.size()) {
      out.push_back(kBase64Alphabet[(packed >> (18u - (6u * i))) & 0x3Fu]);
    } else {
      out.push_back('=');
    }
  }
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto digits = hex;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
  }
  auto hash = hash32_t{};
  if (digits.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_value(digits[2 * i]);
    auto low = hex_value(digits[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t offset = 0; offset < bytes.size(); offset += 3) {
    append_base64_group(
        out, bytes.subspan(offset, std::min<std::size_t>(3, bytes.size() -
                                                                 offset)));
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace escrow::schema
