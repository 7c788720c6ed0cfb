#include <benefactor/schema/reputation_tier.hpp>

namespace benefactor::schema {

std::string_view display_name(const reputation_tier_t value) {
  switch (value) {
    case reputation_tier_t::bronze:
      return "Bronze";
    case reputation_tier_t::silver:
      return "Silver";
    case reputation_tier_t::gold:
      return "Gold";
    case reputation_tier_t::platinum:
      return "Platinum";
    case reputation_tier_t::diamond:
      return "Diamond";
  }
  return "Unknown";
}

reputation_tier_t tier_for_total(const amount_t& total) {
  if (total >= kDiamondThreshold) {
    return reputation_tier_t::diamond;
  }
  if (total >= kPlatinumThreshold) {
    return reputation_tier_t::platinum;
  }
  if (total >= kGoldThreshold) {
    return reputation_tier_t::gold;
  }
  if (total >= kSilverThreshold) {
    return reputation_tier_t::silver;
  }
  return reputation_tier_t::bronze;
}

}  // namespace benefactor::schema
