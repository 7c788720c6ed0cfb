#pragma once
#include <benefactor/schema/primitives.hpp>

namespace benefactor::schema {

template <uint16_t Version>
struct token_support_state;

template <>
struct token_support_state<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  bool supported{};
  timestamp_milliseconds_t updated_at{};
};

using token_support_state_t = token_support_state<1>;

}  // namespace benefactor::schema
