#pragma once

#include <benefactor/execution/execution_context.hpp>
#include <benefactor/execution/result.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/token_support_state.hpp>
#include <optional>

namespace benefactor::execution {

/// Whitelist of tokens accepted for donations.
class token_registry final {
 public:
  explicit token_registry(execution_context& context);

  /// Privileged; authorization is checked by the engine before dispatch.
  result_t<void> set_support(const benefactor::schema::token_id_t& token_id,
                             bool supported);

  bool is_supported(const benefactor::schema::token_id_t& token_id) const;

  std::optional<benefactor::schema::token_support_state_t> support_state(
      const benefactor::schema::token_id_t& token_id) const;

 private:
  execution_context& context_;
};

}  // namespace benefactor::execution
