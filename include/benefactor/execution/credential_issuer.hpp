#pragma once

#include <benefactor/execution/execution_context.hpp>
#include <benefactor/execution/result.hpp>
#include <benefactor/schema/credential_state.hpp>
#include <benefactor/schema/primitives.hpp>
#include <optional>
#include <string>

namespace benefactor::execution {

/// Issuer of the soulbound reputation credential, one per donor.
///
/// Credential ids start at 1. Every path that sets or changes an owner goes
/// through `attempt_ownership_change`, which refuses any move between two
/// non-null identities.
class credential_issuer final {
 public:
  explicit credential_issuer(execution_context& context);

  /// Mint an empty Bronze credential owned by `donor`.
  result_t<benefactor::schema::credential_id_t> mint_for(
      const benefactor::schema::account_id_t& donor,
      std::string metadata_ref);

  /// Add one donation of `amount` and recompute the tier.
  result_t<benefactor::schema::credential_state_t> update_for(
      benefactor::schema::credential_id_t credential_id,
      const benefactor::schema::amount_t& amount);

  /// Fails with token_not_transferable when both endpoints are non-null and
  /// with invalid_address when both are null.
  result_t<void> attempt_ownership_change(
      const benefactor::schema::account_id_t& from,
      const benefactor::schema::account_id_t& to,
      benefactor::schema::credential_id_t credential_id) const;

  std::optional<benefactor::schema::credential_id_t> credential_id(
      const benefactor::schema::account_id_t& donor) const;

  std::optional<benefactor::schema::credential_state_t> credential(
      const benefactor::schema::account_id_t& donor) const;

  std::optional<benefactor::schema::credential_state_t> credential_by_id(
      benefactor::schema::credential_id_t credential_id) const;

 private:
  execution_context& context_;
};

}  // namespace benefactor::execution
