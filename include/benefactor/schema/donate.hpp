#pragma once
#include <benefactor/schema/primitives.hpp>
#include <string>

// Schema type: donate.
// Donation workflow: moves `amount` of `token_id` from the signer to a
// verified charity and credits the signer's reputation credential.
namespace benefactor::schema {

template <uint16_t Version>
struct donate;

template <>
struct donate<1> final {
  uint16_t version{1};
  account_id_t charity_id{};
  token_id_t token_id{};
  amount_t amount{};
  std::string message;
};

using donate_t = donate<1>;

}  // namespace benefactor::schema
