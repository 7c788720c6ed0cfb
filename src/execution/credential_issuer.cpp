#include <benefactor/execution/credential_issuer.hpp>
#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/key/engine_keys.hpp>
#include <benefactor/schema/reputation_tier.hpp>
#include <benefactor/schema/transaction_error_code.hpp>

#include <spdlog/spdlog.h>
#include <string>
#include <utility>

using namespace benefactor::schema;

namespace benefactor::execution {

credential_issuer::credential_issuer(execution_context& context)
    : context_{context} {}

result_t<credential_id_t> credential_issuer::mint_for(
    const account_id_t& donor,
    std::string metadata_ref) {
  auto credential_key = key::make_credential_key(donor);
  if (context_.state.contains(credential_key)) {
    return fail(transaction_error_code::token_already_minted);
  }

  auto seq_key = key::make_prefix_key(key::kCredentialSeqKey);
  auto next_id = context_.state.get<credential_id_t>(seq_key).value_or(1);

  auto ownership = attempt_ownership_change(make_zero_hash(), donor, next_id);
  if (!ownership) {
    return outcome::failure(ownership.error());
  }

  auto credential = credential_state_t{
      .credential_id = next_id,
      .owner = donor,
      .total_donated = 0,
      .donation_count = 0,
      .tier = reputation_tier_t::bronze,
      .last_donation_at = context_.now,
      .metadata_ref = std::move(metadata_ref)};
  context_.state.put(credential_key, credential);
  context_.state.put(key::make_credential_owner_key(next_id), donor);
  context_.state.put(seq_key, credential_id_t{next_id + 1});

  context_.events.push_back(make_event(
      event_type_t::credential_minted,
      {{.key = "credential_id",
        .value = std::to_string(next_id),
        .index = true},
       {.key = "owner", .value = to_hex(donor), .index = true},
       {.key = "tier", .value = std::string{display_name(credential.tier)}}}));
  spdlog::debug("Minted credential {} for {}", next_id, to_hex(donor));
  return next_id;
}

result_t<credential_state_t> credential_issuer::update_for(
    const credential_id_t credential_id,
    const amount_t& amount) {
  auto owner = context_.state.get<account_id_t>(
      key::make_credential_owner_key(credential_id));
  if (!owner) {
    return fail(transaction_error_code::credential_missing);
  }
  auto credential_key = key::make_credential_key(*owner);
  auto credential = context_.state.get<credential_state_t>(credential_key);
  if (!credential) {
    return fail(transaction_error_code::credential_missing);
  }

  auto updated_total = credential->total_donated + amount;
  if (updated_total < credential->total_donated) {
    return fail(transaction_error_code::invalid_amount);
  }

  auto previous_tier = credential->tier;
  credential->total_donated = updated_total;
  ++credential->donation_count;
  credential->last_donation_at = context_.now;
  credential->tier = tier_for_total(credential->total_donated);
  context_.state.put(credential_key, *credential);

  context_.events.push_back(make_event(
      event_type_t::credential_updated,
      {{.key = "credential_id",
        .value = std::to_string(credential_id),
        .index = true},
       {.key = "owner", .value = to_hex(*owner), .index = true},
       {.key = "total_donated",
        .value = benefactor::schema::to_string(credential->total_donated)},
       {.key = "donation_count",
        .value = std::to_string(credential->donation_count)},
       {.key = "tier", .value = std::string{display_name(credential->tier)}}}));
  if (previous_tier != credential->tier) {
    spdlog::info("Credential {} promoted from {} to {}", credential_id,
                 display_name(previous_tier), display_name(credential->tier));
  }
  return *credential;
}

result_t<void> credential_issuer::attempt_ownership_change(
    const account_id_t& from,
    const account_id_t& to,
    const credential_id_t credential_id) const {
  auto from_null = is_null(from);
  auto to_null = is_null(to);
  if (!from_null && !to_null) {
    spdlog::warn("Refused ownership change of credential {} from {} to {}",
                 credential_id, to_hex(from), to_hex(to));
    return fail(transaction_error_code::token_not_transferable);
  }
  if (from_null && to_null) {
    return fail(transaction_error_code::invalid_address);
  }
  return outcome::success();
}

std::optional<credential_id_t> credential_issuer::credential_id(
    const account_id_t& donor) const {
  auto stored = credential(donor);
  if (!stored) {
    return std::nullopt;
  }
  return stored->credential_id;
}

std::optional<credential_state_t> credential_issuer::credential(
    const account_id_t& donor) const {
  return context_.state.get<credential_state_t>(
      key::make_credential_key(donor));
}

std::optional<credential_state_t> credential_issuer::credential_by_id(
    const credential_id_t credential_id) const {
  auto owner = context_.state.get<account_id_t>(
      key::make_credential_owner_key(credential_id));
  if (!owner) {
    return std::nullopt;
  }
  return credential(*owner);
}

}  // namespace benefactor::execution
