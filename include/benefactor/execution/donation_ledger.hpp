#pragma once

#include <benefactor/execution/charity_registry.hpp>
#include <benefactor/execution/credential_issuer.hpp>
#include <benefactor/execution/execution_context.hpp>
#include <benefactor/execution/result.hpp>
#include <benefactor/execution/token_registry.hpp>
#include <benefactor/execution/value_transfer.hpp>
#include <benefactor/schema/donate.hpp>
#include <benefactor/schema/donation_record.hpp>
#include <benefactor/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace benefactor::execution {

/// Append-only donation ledger. Drives the charity registry and the credential
/// issuer inside the caller's overlay so one donation lands as a single unit.
class donation_ledger final {
 public:
  explicit donation_ledger(execution_context& context);

  /// Validate, stage every effect, then move the funds. The returned id is the
  /// new record's; on failure the caller must discard the overlay.
  result_t<benefactor::schema::donation_id_t> donate(
      const benefactor::schema::account_id_t& donor,
      const benefactor::schema::donate_t& payload,
      const value_transfer_t& transfer);

  std::optional<benefactor::schema::donation_record_t> donation(
      benefactor::schema::donation_id_t donation_id) const;

  /// Ascending ids of donations received by `charity_id`.
  std::vector<benefactor::schema::donation_id_t> charity_donation_ids(
      const benefactor::schema::account_id_t& charity_id) const;

  /// Ascending ids of donations made by `donor`.
  std::vector<benefactor::schema::donation_id_t> donor_donation_ids(
      const benefactor::schema::account_id_t& donor) const;

 private:
  std::vector<benefactor::schema::donation_id_t> list_index(
      const benefactor::schema::bytes_t& prefix) const;

  execution_context& context_;
  token_registry tokens_;
  charity_registry charities_;
  credential_issuer credentials_;
};

}  // namespace benefactor::execution
