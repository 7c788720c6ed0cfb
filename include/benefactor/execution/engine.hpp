#pragma once

#include <benefactor/execution/access_policy.hpp>
#include <benefactor/execution/execution_context.hpp>
#include <benefactor/execution/reentrancy_guard.hpp>
#include <benefactor/execution/result.hpp>
#include <benefactor/execution/state_overlay.hpp>
#include <benefactor/execution/value_transfer.hpp>
#include <benefactor/schema/app_info.hpp>
#include <benefactor/schema/charity_state.hpp>
#include <benefactor/schema/credential_state.hpp>
#include <benefactor/schema/donation_record.hpp>
#include <benefactor/schema/history_entry.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/privileged_action.hpp>
#include <benefactor/schema/query_result.hpp>
#include <benefactor/schema/transaction.hpp>
#include <benefactor/schema/transaction_error_code.hpp>
#include <benefactor/schema/transaction_result.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benefactor::execution {

/// Donation ledger state machine.
///
/// Transactions run one at a time. Each one stages its writes in a
/// `state_overlay`; a successful transaction commits the overlay, its history
/// row and the new ledger head in one RocksDB write batch, a failed one
/// leaves storage untouched.
class engine final {
 public:
  /// `policy` gates privileged actions. `custody` is the identity holding
  /// funds recovered by emergency withdrawals.
  engine(encoder_t& encoder,
         storage_t& storage,
         std::shared_ptr<const access_policy> policy,
         benefactor::schema::account_id_t custody);

  /// Validate, authorize and apply one transaction.
  ///
  /// A nested call made while another transaction is executing (for example
  /// from inside the value transfer primitive) fails with `reentrant_call`.
  benefactor::schema::transaction_result_t execute(
      const benefactor::schema::transaction_t& tx);

  /// Decode SCALE transaction bytes, then execute.
  benefactor::schema::transaction_result_t execute(
      const benefactor::schema::bytes_view_t& raw_tx);

  /// Read-path query by route; the value is the SCALE-encoded answer.
  benefactor::schema::query_result_t query(
      std::string_view path,
      const benefactor::schema::bytes_view_t& key) const;

  std::optional<benefactor::schema::charity_state_t> charity(
      const benefactor::schema::account_id_t& charity_id) const;
  benefactor::schema::amount_t contribution(
      const benefactor::schema::account_id_t& charity_id,
      const benefactor::schema::account_id_t& donor) const;
  std::optional<benefactor::schema::donation_record_t> donation(
      benefactor::schema::donation_id_t donation_id) const;
  std::vector<benefactor::schema::donation_id_t> charity_donation_ids(
      const benefactor::schema::account_id_t& charity_id) const;
  std::vector<benefactor::schema::donation_id_t> donor_donation_ids(
      const benefactor::schema::account_id_t& donor) const;
  bool is_token_supported(const benefactor::schema::token_id_t& token_id) const;
  std::optional<benefactor::schema::credential_id_t> credential_id(
      const benefactor::schema::account_id_t& donor) const;
  std::optional<benefactor::schema::credential_state_t> credential(
      const benefactor::schema::account_id_t& donor) const;
  /// Descriptor `data:` URI of the donor's credential.
  std::optional<std::string> credential_uri(
      const benefactor::schema::account_id_t& donor) const;

  /// Last applied sequence and state root.
  benefactor::schema::app_info_t info() const;

  /// History entries in the inclusive sequence range.
  std::vector<benefactor::schema::history_entry_t> history(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  /// Install the external value transfer primitive. Without one every
  /// transfer is refused.
  void set_value_transfer(value_transfer_t transfer);

  /// Install the time source used to stamp records.
  void set_clock(clock_source_t clock);

  const access_policy& policy() const { return *policy_; }

 private:
  template <typename Fn>
  auto read(Fn&& fn) const;

  result_t<benefactor::schema::bytes_t> apply(
      const benefactor::schema::transaction_t& tx,
      execution_context& context,
      const value_transfer_t& transfer);

  result_t<void> authorize(benefactor::schema::privileged_action_t action,
                           const benefactor::schema::transaction_t& tx) const;

  result_t<void> emergency_withdraw(
      const benefactor::schema::emergency_withdraw_t& payload,
      execution_context& context,
      const value_transfer_t& transfer);

  mutable std::recursive_mutex mutex_;
  reentrancy_lock reentrancy_;
  encoder_t& encoder_;
  storage_t& storage_;
  std::shared_ptr<const access_policy> policy_;
  benefactor::schema::account_id_t custody_;
  value_transfer_t value_transfer_;
  clock_source_t clock_;
  uint64_t last_sequence_{};
  benefactor::schema::hash32_t state_root_{};
};

}  // namespace benefactor::execution
