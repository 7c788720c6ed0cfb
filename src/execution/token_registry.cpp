#include <benefactor/execution/token_registry.hpp>
#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/key/engine_keys.hpp>
#include <benefactor/schema/transaction_error_code.hpp>

#include <spdlog/spdlog.h>

namespace benefactor::execution {

token_registry::token_registry(execution_context& context)
    : context_{context} {}

result_t<void> token_registry::set_support(
    const benefactor::schema::token_id_t& token_id,
    const bool supported) {
  if (benefactor::schema::is_null(token_id)) {
    return fail(benefactor::schema::transaction_error_code::invalid_address);
  }

  context_.state.put(benefactor::schema::key::make_token_support_key(token_id),
                     benefactor::schema::token_support_state_t{
                         .token_id = token_id,
                         .supported = supported,
                         .updated_at = context_.now});
  context_.events.push_back(benefactor::schema::make_event(
      benefactor::schema::event_type_t::token_support_changed,
      {{.key = "token_id",
        .value = benefactor::schema::to_hex(token_id),
        .index = true},
       {.key = "supported", .value = supported ? "true" : "false"}}));
  spdlog::debug("Token {} support set to {}",
                benefactor::schema::to_hex(token_id), supported);
  return outcome::success();
}

bool token_registry::is_supported(
    const benefactor::schema::token_id_t& token_id) const {
  auto state = support_state(token_id);
  return state.has_value() && state->supported;
}

std::optional<benefactor::schema::token_support_state_t>
token_registry::support_state(
    const benefactor::schema::token_id_t& token_id) const {
  return context_.state.get<benefactor::schema::token_support_state_t>(
      benefactor::schema::key::make_token_support_key(token_id));
}

}  // namespace benefactor::execution
