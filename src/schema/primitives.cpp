#include <benefactor/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace benefactor::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  auto lower = static_cast<char>(c | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return static_cast<uint8_t>(lower - 'a' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  auto digits = bytes;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
  }
  auto identity = hash32_t{};
  if (digits.size() != identity.size() * 2) {
    return std::nullopt;
  }
  for (size_t i = 0; i < identity.size(); ++i) {
    auto high = hex_value(digits[2 * i]);
    auto low = hex_value(digits[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    identity[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return identity;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_null(const hash32_t& value) {
  return std::all_of(std::begin(value), std::end(value),
                     [](const uint8_t byte) { return byte == 0; });
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

std::string to_hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (size_t offset = 0; offset < bytes.size(); offset += 3) {
    auto available = std::min<size_t>(3, bytes.size() - offset);
    auto group = uint32_t{};
    for (size_t i = 0; i < 3; ++i) {
      group <<= 8u;
      if (i < available) {
        group |= bytes[offset + i];
      }
    }
    // `available` input bytes yield `available + 1` output characters.
    for (size_t i = 0; i < 4; ++i) {
      out.push_back(i <= available
                        ? kBase64Alphabet[(group >> (18u - (6u * i))) & 0x3Fu]
                        : '=');
    }
  }
  return out;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  // 2^256 - 1 has 78 decimal digits.
  if (decimal.empty() || decimal.size() > 78) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::cpp_int{};
  for (const auto ch : decimal) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value *= 10;
    value += static_cast<unsigned>(ch - '0');
  }
  if (value >
      boost::multiprecision::cpp_int{std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::array<uint8_t, 8> make_ordered_id(const uint64_t id) {
  auto buffer = boost::endian::big_uint64_buf_t{id};
  auto out = std::array<uint8_t, 8>{};
  std::copy_n(buffer.data(), out.size(), std::begin(out));
  return out;
}

}  // namespace benefactor::schema
