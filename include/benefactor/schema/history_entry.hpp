#pragma once

#include <benefactor/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Donation workflow: audit row holding the encoded bytes of every applied
// transaction, keyed by ledger sequence.
namespace benefactor::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t applied_at{};
  hash32_t state_root{};  // root after applying this transaction
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace benefactor::schema
