#pragma once

#include <benefactor/execution/execution_context.hpp>
#include <benefactor/execution/result.hpp>
#include <benefactor/schema/charity_state.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/register_charity.hpp>
#include <cstddef>
#include <optional>

namespace benefactor::execution {

/// Upper bound on each free-text field persisted with a charity.
inline constexpr std::size_t kMaxCharityFieldBytes = 1024;

/// Charity records and their per-donor contribution relation.
///
/// Lifecycle is Unregistered -> Registered (unverified) -> Verified. There is
/// no path back from Verified.
class charity_registry final {
 public:
  explicit charity_registry(execution_context& context);

  /// The caller becomes the charity identity.
  result_t<benefactor::schema::charity_state_t> register_charity(
      const benefactor::schema::account_id_t& caller,
      const benefactor::schema::register_charity_t& payload);

  /// Privileged; authorization is checked by the engine before dispatch.
  result_t<void> verify_charity(
      const benefactor::schema::account_id_t& charity_id);

  /// Credit `amount` from `donor`. Only the donation ledger calls this.
  result_t<void> record_contribution(
      const benefactor::schema::account_id_t& charity_id,
      const benefactor::schema::account_id_t& donor,
      const benefactor::schema::amount_t& amount);

  std::optional<benefactor::schema::charity_state_t> charity(
      const benefactor::schema::account_id_t& charity_id) const;

  /// Cumulative amount `donor` gave to `charity_id`; zero when none.
  benefactor::schema::amount_t contribution(
      const benefactor::schema::account_id_t& charity_id,
      const benefactor::schema::account_id_t& donor) const;

 private:
  execution_context& context_;
};

}  // namespace benefactor::execution
