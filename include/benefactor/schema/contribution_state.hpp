#pragma once
#include <benefactor/schema/primitives.hpp>

// Schema type: contribution state.
// Donation workflow: cumulative amount one donor has given to one charity,
// stored as its own (charity, donor) relation.
namespace benefactor::schema {

template <uint16_t Version>
struct contribution_state;

template <>
struct contribution_state<1> final {
  uint16_t version{1};
  account_id_t charity_id{};
  account_id_t donor{};
  amount_t amount{};
};

using contribution_state_t = contribution_state<1>;

}  // namespace benefactor::schema
