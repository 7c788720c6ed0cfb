#pragma once

#include <benefactor/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Donation workflow: canonical key prefixes for ledger state, secondary
// indexes and history. Every key is the raw prefix followed by the raw
// identity bytes and big-endian ids, so prefix scans return ascending ids.
namespace benefactor::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kTokenSupportKeyPrefix{
    "SYS|STATE|TOKEN_SUPPORT|"};
inline constexpr std::string_view kCharityKeyPrefix{"SYS|STATE|CHARITY|"};
inline constexpr std::string_view kContributionKeyPrefix{
    "SYS|STATE|CONTRIBUTION|"};
inline constexpr std::string_view kDonationKeyPrefix{"SYS|STATE|DONATION|"};
inline constexpr std::string_view kCredentialKeyPrefix{
    "SYS|STATE|CREDENTIAL|"};
inline constexpr std::string_view kDonationSeqKey{"SYS|STATE|DONATION_SEQ|"};
inline constexpr std::string_view kCredentialSeqKey{
    "SYS|STATE|CREDENTIAL_SEQ|"};
inline constexpr std::string_view kCharityDonationIndexPrefix{
    "SYS|INDEX|CHARITY_DONATION|"};
inline constexpr std::string_view kDonorDonationIndexPrefix{
    "SYS|INDEX|DONOR_DONATION|"};
inline constexpr std::string_view kCredentialOwnerIndexPrefix{
    "SYS|INDEX|CREDENTIAL_OWNER|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline constexpr std::array<std::string_view, 12> kEngineKeyspaces{
    kStatePrefix,
    kTokenSupportKeyPrefix,
    kCharityKeyPrefix,
    kContributionKeyPrefix,
    kDonationKeyPrefix,
    kCredentialKeyPrefix,
    kDonationSeqKey,
    kCredentialSeqKey,
    kCharityDonationIndexPrefix,
    kDonorDonationIndexPrefix,
    kCredentialOwnerIndexPrefix,
    kHistoryPrefix};

benefactor::schema::bytes_t make_prefix_key(std::string_view prefix);

benefactor::schema::bytes_t make_token_support_key(
    const benefactor::schema::token_id_t& token_id);

benefactor::schema::bytes_t make_charity_key(
    const benefactor::schema::account_id_t& charity_id);

benefactor::schema::bytes_t make_contribution_key(
    const benefactor::schema::account_id_t& charity_id,
    const benefactor::schema::account_id_t& donor);

benefactor::schema::bytes_t make_donation_key(
    benefactor::schema::donation_id_t donation_id);

benefactor::schema::bytes_t make_charity_donation_index_prefix(
    const benefactor::schema::account_id_t& charity_id);

benefactor::schema::bytes_t make_charity_donation_index_key(
    const benefactor::schema::account_id_t& charity_id,
    benefactor::schema::donation_id_t donation_id);

benefactor::schema::bytes_t make_donor_donation_index_prefix(
    const benefactor::schema::account_id_t& donor);

benefactor::schema::bytes_t make_donor_donation_index_key(
    const benefactor::schema::account_id_t& donor,
    benefactor::schema::donation_id_t donation_id);

benefactor::schema::bytes_t make_credential_key(
    const benefactor::schema::account_id_t& owner);

benefactor::schema::bytes_t make_credential_owner_key(
    benefactor::schema::credential_id_t credential_id);

benefactor::schema::bytes_t make_history_key(uint64_t sequence);

}  // namespace benefactor::schema::key
