#pragma once
#include <benefactor/schema/donate.hpp>
#include <benefactor/schema/emergency_withdraw.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/register_charity.hpp>
#include <benefactor/schema/set_token_support.hpp>
#include <benefactor/schema/transfer_credential.hpp>
#include <benefactor/schema/verify_charity.hpp>
#include <variant>
#include <vector>

namespace benefactor::schema {

using transaction_payload_t = std::variant<register_charity_t,
                                           verify_charity_t,
                                           set_token_support_t,
                                           donate_t,
                                           emergency_withdraw_t,
                                           transfer_credential_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer{};
  // Additional approvers counted by multi-signature access policies.
  std::vector<account_id_t> co_signers;
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace benefactor::schema
