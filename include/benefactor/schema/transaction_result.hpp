#pragma once

#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Donation workflow: outcome of one executed transaction. A zero code means
// every effect was applied; any other code means none was.
namespace benefactor::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;  // SCALE-encoded operation output (donation id, ...)
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t sequence{};  // ledger sequence assigned on success
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
};

using transaction_result_t = transaction_result<1>;

}  // namespace benefactor::schema
