#pragma once
#include <benefactor/schema/primitives.hpp>
#include <string>

// Schema type: register charity.
// Donation workflow: onboarding; the transaction signer becomes the charity
// identity and the payout target of its donations.
namespace benefactor::schema {

template <uint16_t Version>
struct register_charity;

template <>
struct register_charity<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
  std::string metadata_ref;
};

using register_charity_t = register_charity<1>;

}  // namespace benefactor::schema
