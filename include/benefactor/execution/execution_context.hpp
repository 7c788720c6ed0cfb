#pragma once

#include <benefactor/execution/state_overlay.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/transaction_event.hpp>
#include <vector>

namespace benefactor::execution {

/// Everything a component touches while one transaction executes: the staged
/// state, the events collected so far and the transaction timestamp.
struct execution_context final {
  state_overlay& state;
  std::vector<benefactor::schema::transaction_event_t>& events;
  benefactor::schema::timestamp_milliseconds_t now{};
};

}  // namespace benefactor::execution
