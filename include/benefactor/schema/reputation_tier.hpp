#pragma once

#include <benefactor/schema/enum_string.hpp>
#include <benefactor/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: reputation tier.
// Donation workflow: ordered donor classification derived from the cumulative
// amount a donor has given across all charities.
namespace benefactor::schema {

enum class reputation_tier_t : uint8_t {
  bronze = 0,
  silver = 1,
  gold = 2,
  platinum = 3,
  diamond = 4
};

// Inclusive lower bounds, in the base value unit of the donated tokens.
inline constexpr uint64_t kSilverThreshold = 500;
inline constexpr uint64_t kGoldThreshold = 1000;
inline constexpr uint64_t kPlatinumThreshold = 5000;
inline constexpr uint64_t kDiamondThreshold = 10000;

inline constexpr auto kReputationTierMappings = std::array{
    std::pair<std::string_view, reputation_tier_t>{"bronze",
                                                   reputation_tier_t::bronze},
    std::pair<std::string_view, reputation_tier_t>{"silver",
                                                   reputation_tier_t::silver},
    std::pair<std::string_view, reputation_tier_t>{"gold",
                                                   reputation_tier_t::gold},
    std::pair<std::string_view, reputation_tier_t>{
        "platinum", reputation_tier_t::platinum},
    std::pair<std::string_view, reputation_tier_t>{"diamond",
                                                   reputation_tier_t::diamond},
};

template <>
inline std::optional<reputation_tier_t> try_from_string<reputation_tier_t>(
    const std::string_view value) {
  return from_string(value, kReputationTierMappings);
}

inline constexpr std::string_view to_string(const reputation_tier_t value) {
  return to_string(value, kReputationTierMappings).value_or("unknown");
}

/// Display label used in credential descriptors ("Bronze", "Silver", ...).
std::string_view display_name(reputation_tier_t value);

/// Tier for a cumulative donation total, evaluated highest threshold first.
reputation_tier_t tier_for_total(const amount_t& total);

}  // namespace benefactor::schema
