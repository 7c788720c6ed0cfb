#pragma once
#include <benefactor/schema/primitives.hpp>
#include <cstdint>

namespace benefactor::blake3 {

/// Chain the ledger state root over one applied transaction:
/// blake3(previous_root || sequence (big-endian) || tx_bytes).
benefactor::schema::hash32_t fold_state_root(
    const benefactor::schema::hash32_t& previous_root,
    uint64_t sequence,
    const benefactor::schema::bytes_view_t& tx_bytes);

}  // namespace benefactor::blake3
