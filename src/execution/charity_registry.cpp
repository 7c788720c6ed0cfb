#include <benefactor/execution/charity_registry.hpp>
#include <benefactor/schema/contribution_state.hpp>
#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/key/engine_keys.hpp>
#include <benefactor/schema/transaction_error_code.hpp>

#include <spdlog/spdlog.h>

using namespace benefactor::schema;

namespace benefactor::execution {

charity_registry::charity_registry(execution_context& context)
    : context_{context} {}

result_t<charity_state_t> charity_registry::register_charity(
    const account_id_t& caller,
    const register_charity_t& payload) {
  auto charity_key = key::make_charity_key(caller);
  if (context_.state.contains(charity_key)) {
    return fail(transaction_error_code::charity_already_registered);
  }
  if (payload.name.empty() || payload.metadata_ref.empty()) {
    return fail(transaction_error_code::invalid_address);
  }
  if (payload.name.size() > kMaxCharityFieldBytes ||
      payload.description.size() > kMaxCharityFieldBytes ||
      payload.metadata_ref.size() > kMaxCharityFieldBytes) {
    return fail(transaction_error_code::invalid_metadata);
  }

  auto charity = charity_state_t{.charity_id = caller,
                                 .name = payload.name,
                                 .description = payload.description,
                                 .metadata_ref = payload.metadata_ref,
                                 .verified = false,
                                 .total_donations = 0,
                                 .donor_count = 0,
                                 .created_at = context_.now,
                                 .updated_at = context_.now};
  context_.state.put(charity_key, charity);
  context_.events.push_back(make_event(
      event_type_t::charity_registered,
      {{.key = "charity_id", .value = to_hex(caller), .index = true},
       {.key = "name", .value = payload.name},
       {.key = "metadata_ref", .value = payload.metadata_ref}}));
  spdlog::debug("Registered charity '{}' as {}", payload.name, to_hex(caller));
  return charity;
}

result_t<void> charity_registry::verify_charity(
    const account_id_t& charity_id) {
  auto charity_key = key::make_charity_key(charity_id);
  auto charity = context_.state.get<charity_state_t>(charity_key);
  if (!charity) {
    return fail(transaction_error_code::charity_not_registered);
  }
  if (charity->verified) {
    return fail(transaction_error_code::already_verified);
  }

  charity->verified = true;
  charity->updated_at = context_.now;
  context_.state.put(charity_key, *charity);
  context_.events.push_back(make_event(
      event_type_t::charity_verified,
      {{.key = "charity_id", .value = to_hex(charity_id), .index = true}}));
  return outcome::success();
}

result_t<void> charity_registry::record_contribution(
    const account_id_t& charity_id,
    const account_id_t& donor,
    const amount_t& amount) {
  auto charity_key = key::make_charity_key(charity_id);
  auto charity = context_.state.get<charity_state_t>(charity_key);
  if (!charity) {
    return fail(transaction_error_code::charity_not_registered);
  }

  auto previous = contribution(charity_id, donor);
  auto updated_total = charity->total_donations + amount;
  auto updated_contribution = previous + amount;
  // uint256 arithmetic wraps.
  if (updated_total < charity->total_donations ||
      updated_contribution < previous) {
    return fail(transaction_error_code::invalid_amount);
  }

  if (previous == 0) {
    ++charity->donor_count;
  }
  charity->total_donations = updated_total;
  charity->updated_at = context_.now;
  context_.state.put(charity_key, *charity);
  context_.state.put(key::make_contribution_key(charity_id, donor),
                     contribution_state_t{.charity_id = charity_id,
                                          .donor = donor,
                                          .amount = updated_contribution});
  return outcome::success();
}

std::optional<charity_state_t> charity_registry::charity(
    const account_id_t& charity_id) const {
  return context_.state.get<charity_state_t>(key::make_charity_key(charity_id));
}

amount_t charity_registry::contribution(const account_id_t& charity_id,
                                        const account_id_t& donor) const {
  auto stored = context_.state.get<contribution_state_t>(
      key::make_contribution_key(charity_id, donor));
  if (!stored) {
    return 0;
  }
  return stored->amount;
}

}  // namespace benefactor::execution
