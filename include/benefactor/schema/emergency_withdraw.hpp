#pragma once
#include <benefactor/schema/primitives.hpp>
#include <optional>

// Schema type: emergency withdraw.
// Donation workflow: privileged recovery of residual balances held by the
// ledger's custody identity. No token means the native currency.
namespace benefactor::schema {

template <uint16_t Version>
struct emergency_withdraw;

template <>
struct emergency_withdraw<1> final {
  uint16_t version{1};
  std::optional<token_id_t> token_id;
  account_id_t to{};
  amount_t amount{};
};

using emergency_withdraw_t = emergency_withdraw<1>;

}  // namespace benefactor::schema
