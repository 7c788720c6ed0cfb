#pragma once

#include <benefactor/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace benefactor::execution {

/// One movement of value requested from the external transfer primitive.
struct transfer_request final {
  std::optional<benefactor::schema::token_id_t> token_id;  // none: native
  benefactor::schema::account_id_t from{};
  benefactor::schema::account_id_t to{};
  benefactor::schema::amount_t amount{};
};

/// External value-transfer primitive (`transferFrom`-like). Returns false when
/// the movement did not happen.
using value_transfer_t = std::function<bool(const transfer_request& request)>;

/// Time source for record timestamps, in Unix milliseconds.
using clock_source_t =
    std::function<benefactor::schema::timestamp_milliseconds_t()>;

/// Run `transfer` for `request`. A missing primitive or one that throws counts
/// as a refused transfer.
bool request_transfer(const value_transfer_t& transfer,
                      const transfer_request& request);

/// Wall clock in Unix milliseconds.
benefactor::schema::timestamp_milliseconds_t system_clock_milliseconds();

}  // namespace benefactor::execution
