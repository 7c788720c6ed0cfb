#include <benefactor/schema/key/engine_keys.hpp>

#include <iterator>

namespace benefactor::schema::key {

namespace {

template <typename... Parts>
benefactor::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                              const Parts&... parts) {
  auto key = benefactor::schema::make_bytes(prefix);
  key.reserve(key.size() + (parts.size() + ... + 0));
  (key.insert(std::end(key), std::begin(parts), std::end(parts)), ...);
  return key;
}

}  // namespace

benefactor::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return benefactor::schema::make_bytes(prefix);
}

benefactor::schema::bytes_t make_token_support_key(
    const benefactor::schema::token_id_t& token_id) {
  return make_prefixed_key(kTokenSupportKeyPrefix, token_id);
}

benefactor::schema::bytes_t make_charity_key(
    const benefactor::schema::account_id_t& charity_id) {
  return make_prefixed_key(kCharityKeyPrefix, charity_id);
}

benefactor::schema::bytes_t make_contribution_key(
    const benefactor::schema::account_id_t& charity_id,
    const benefactor::schema::account_id_t& donor) {
  return make_prefixed_key(kContributionKeyPrefix, charity_id, donor);
}

benefactor::schema::bytes_t make_donation_key(
    const benefactor::schema::donation_id_t donation_id) {
  return make_prefixed_key(kDonationKeyPrefix,
                           benefactor::schema::make_ordered_id(donation_id));
}

benefactor::schema::bytes_t make_charity_donation_index_prefix(
    const benefactor::schema::account_id_t& charity_id) {
  return make_prefixed_key(kCharityDonationIndexPrefix, charity_id);
}

benefactor::schema::bytes_t make_charity_donation_index_key(
    const benefactor::schema::account_id_t& charity_id,
    const benefactor::schema::donation_id_t donation_id) {
  return make_prefixed_key(kCharityDonationIndexPrefix, charity_id,
                           benefactor::schema::make_ordered_id(donation_id));
}

benefactor::schema::bytes_t make_donor_donation_index_prefix(
    const benefactor::schema::account_id_t& donor) {
  return make_prefixed_key(kDonorDonationIndexPrefix, donor);
}

benefactor::schema::bytes_t make_donor_donation_index_key(
    const benefactor::schema::account_id_t& donor,
    const benefactor::schema::donation_id_t donation_id) {
  return make_prefixed_key(kDonorDonationIndexPrefix, donor,
                           benefactor::schema::make_ordered_id(donation_id));
}

benefactor::schema::bytes_t make_credential_key(
    const benefactor::schema::account_id_t& owner) {
  return make_prefixed_key(kCredentialKeyPrefix, owner);
}

benefactor::schema::bytes_t make_credential_owner_key(
    const benefactor::schema::credential_id_t credential_id) {
  return make_prefixed_key(kCredentialOwnerIndexPrefix,
                           benefactor::schema::make_ordered_id(credential_id));
}

benefactor::schema::bytes_t make_history_key(const uint64_t sequence) {
  return make_prefixed_key(kHistoryPrefix,
                           benefactor::schema::make_ordered_id(sequence));
}

}  // namespace benefactor::schema::key
