#pragma once

#include <benefactor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Donation workflow: notifications emitted by a successful transaction.
namespace benefactor::schema {

enum class event_type_t : uint8_t {
  token_support_changed = 0,
  charity_registered = 1,
  charity_verified = 2,
  donation_made = 3,
  credential_minted = 4,
  credential_updated = 5,
  emergency_withdrawal = 6
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{
        "token_support_changed", event_type_t::token_support_changed},
    std::pair<std::string_view, event_type_t>{
        "charity_registered", event_type_t::charity_registered},
    std::pair<std::string_view, event_type_t>{"charity_verified",
                                              event_type_t::charity_verified},
    std::pair<std::string_view, event_type_t>{"donation_made",
                                              event_type_t::donation_made},
    std::pair<std::string_view, event_type_t>{"credential_minted",
                                              event_type_t::credential_minted},
    std::pair<std::string_view, event_type_t>{"credential_updated",
                                              event_type_t::credential_updated},
    std::pair<std::string_view, event_type_t>{
        "emergency_withdrawal", event_type_t::emergency_withdrawal},
};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace benefactor::schema
