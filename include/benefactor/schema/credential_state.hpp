#pragma once
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/reputation_tier.hpp>
#include <string>

// Schema type: credential state.
// Donation workflow: the donor's non-transferable reputation credential. The
// owner is fixed at mint; totals only grow.
namespace benefactor::schema {

template <uint16_t Version>
struct credential_state;

template <>
struct credential_state<1> final {
  uint16_t version{1};
  credential_id_t credential_id{};
  account_id_t owner{};
  amount_t total_donated{};
  uint64_t donation_count{};
  reputation_tier_t tier{reputation_tier_t::bronze};
  timestamp_milliseconds_t last_donation_at{};
  std::string metadata_ref;
};

using credential_state_t = credential_state<1>;

}  // namespace benefactor::schema
