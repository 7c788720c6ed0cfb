#pragma once

#include <benefactor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: privileged action.
// Donation workflow: administrative operations gated by the configured access
// policy (charity verification, token whitelisting, fund recovery).
namespace benefactor::schema {

enum class privileged_action_t : uint8_t {
  verify_charity = 0,
  set_token_support = 1,
  emergency_withdraw = 2
};

inline constexpr auto kPrivilegedActionMappings = std::array{
    std::pair<std::string_view, privileged_action_t>{
        "verify_charity", privileged_action_t::verify_charity},
    std::pair<std::string_view, privileged_action_t>{
        "set_token_support", privileged_action_t::set_token_support},
    std::pair<std::string_view, privileged_action_t>{
        "emergency_withdraw", privileged_action_t::emergency_withdraw},
};

template <>
inline std::optional<privileged_action_t> try_from_string<privileged_action_t>(
    const std::string_view value) {
  return from_string(value, kPrivilegedActionMappings);
}

inline constexpr std::string_view to_string(const privileged_action_t value) {
  return to_string(value, kPrivilegedActionMappings).value_or("unknown");
}

}  // namespace benefactor::schema
