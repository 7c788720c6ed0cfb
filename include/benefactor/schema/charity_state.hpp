#pragma once
#include <benefactor/schema/primitives.hpp>
#include <string>

// Schema type: charity state.
// Donation workflow: registered charity with its verification flag and the
// aggregate statistics maintained by the donation ledger.
namespace benefactor::schema {

template <uint16_t Version>
struct charity_state;

template <>
struct charity_state<1> final {
  uint16_t version{1};
  account_id_t charity_id{};
  std::string name;
  std::string description;
  std::string metadata_ref;  // opaque pointer into the metadata store
  bool verified{};
  amount_t total_donations{};
  uint64_t donor_count{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using charity_state_t = charity_state<1>;

}  // namespace benefactor::schema
