#pragma once
#include <array>
#include <boost/endian/buffers.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace benefactor::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;  // donor, charity, controller identities
using token_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using donation_id_t = uint64_t;
using credential_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string_view& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

/// The all-zero identity stands for "nobody" (mint source, burn target).
bool is_null(const hash32_t& value);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& value);

std::string to_base64(const bytes_view_t& bytes);

std::optional<amount_t> try_make_amount(const std::string_view decimal);
std::string to_string(const amount_t& amount);

/// Big-endian id bytes so lexicographic key order equals numeric order.
std::array<uint8_t, 8> make_ordered_id(uint64_t id);

}  // namespace benefactor::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
