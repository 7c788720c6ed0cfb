#pragma once
#include <benefactor/schema/primitives.hpp>
#include <string>

// Schema type: donation record.
// Donation workflow: immutable ledger row written once per successful
// donation.
namespace benefactor::schema {

template <uint16_t Version>
struct donation_record;

template <>
struct donation_record<1> final {
  uint16_t version{1};
  donation_id_t donation_id{};
  account_id_t donor{};
  account_id_t charity_id{};
  amount_t amount{};
  token_id_t token_id{};
  std::string message;
  timestamp_milliseconds_t donated_at{};
};

using donation_record_t = donation_record<1>;

}  // namespace benefactor::schema
