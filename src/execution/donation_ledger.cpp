#include <benefactor/execution/donation_ledger.hpp>
#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/key/engine_keys.hpp>
#include <benefactor/schema/transaction_error_code.hpp>

#include <spdlog/spdlog.h>
#include <string>

using namespace benefactor::schema;

namespace benefactor::execution {

donation_ledger::donation_ledger(execution_context& context)
    : context_{context},
      tokens_{context},
      charities_{context},
      credentials_{context} {}

result_t<donation_id_t> donation_ledger::donate(
    const account_id_t& donor,
    const donate_t& payload,
    const value_transfer_t& transfer) {
  if (!tokens_.is_supported(payload.token_id)) {
    return fail(transaction_error_code::token_not_supported);
  }
  if (payload.amount == 0) {
    return fail(transaction_error_code::invalid_amount);
  }
  auto charity = charities_.charity(payload.charity_id);
  if (!charity) {
    return fail(transaction_error_code::charity_not_registered);
  }
  if (!charity->verified) {
    return fail(transaction_error_code::charity_not_verified);
  }

  auto seq_key = key::make_prefix_key(key::kDonationSeqKey);
  auto donation_id = context_.state.get<donation_id_t>(seq_key).value_or(0);
  context_.state.put(seq_key, donation_id_t{donation_id + 1});
  context_.state.put(key::make_donation_key(donation_id),
                     donation_record_t{.donation_id = donation_id,
                                       .donor = donor,
                                       .charity_id = payload.charity_id,
                                       .amount = payload.amount,
                                       .token_id = payload.token_id,
                                       .message = payload.message,
                                       .donated_at = context_.now});
  context_.state.put(
      key::make_charity_donation_index_key(payload.charity_id, donation_id),
      donation_id);
  context_.state.put(key::make_donor_donation_index_key(donor, donation_id),
                     donation_id);

  auto recorded =
      charities_.record_contribution(payload.charity_id, donor, payload.amount);
  if (!recorded) {
    return outcome::failure(recorded.error());
  }

  auto credential_id = credentials_.credential_id(donor);
  if (!credential_id) {
    auto minted = credentials_.mint_for(donor, std::string{});
    if (!minted) {
      return outcome::failure(minted.error());
    }
    credential_id = minted.value();
  }
  auto updated = credentials_.update_for(*credential_id, payload.amount);
  if (!updated) {
    return outcome::failure(updated.error());
  }

  auto moved = request_transfer(transfer,
                                transfer_request{.token_id = payload.token_id,
                                                 .from = donor,
                                                 .to = payload.charity_id,
                                                 .amount = payload.amount});
  if (!moved) {
    return fail(transaction_error_code::transfer_failed);
  }

  context_.events.push_back(make_event(
      event_type_t::donation_made,
      {{.key = "donation_id",
        .value = std::to_string(donation_id),
        .index = true},
       {.key = "donor", .value = to_hex(donor), .index = true},
       {.key = "charity_id", .value = to_hex(payload.charity_id), .index = true},
       {.key = "amount",
        .value = benefactor::schema::to_string(payload.amount)},
       {.key = "token_id", .value = to_hex(payload.token_id)},
       {.key = "donated_at", .value = std::to_string(context_.now)}}));
  spdlog::debug("Donation {} of {} from {} to {}", donation_id,
                benefactor::schema::to_string(payload.amount), to_hex(donor),
                to_hex(payload.charity_id));
  return donation_id;
}

std::optional<donation_record_t> donation_ledger::donation(
    const donation_id_t donation_id) const {
  return context_.state.get<donation_record_t>(
      key::make_donation_key(donation_id));
}

std::vector<donation_id_t> donation_ledger::charity_donation_ids(
    const account_id_t& charity_id) const {
  return list_index(key::make_charity_donation_index_prefix(charity_id));
}

std::vector<donation_id_t> donation_ledger::donor_donation_ids(
    const account_id_t& donor) const {
  return list_index(key::make_donor_donation_index_prefix(donor));
}

std::vector<donation_id_t> donation_ledger::list_index(
    const bytes_t& prefix) const {
  auto ids = std::vector<donation_id_t>{};
  for (const auto& [index_key, value] : context_.state.list_by_prefix(prefix)) {
    static_cast<void>(index_key);
    ids.push_back(context_.state.encoder().decode<donation_id_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return ids;
}

}  // namespace benefactor::execution
