#pragma once
#include <benefactor/schema/primitives.hpp>

namespace benefactor::schema {

template <uint16_t Version>
struct set_token_support;

template <>
struct set_token_support<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  bool supported{true};
};

using set_token_support_t = set_token_support<1>;

}  // namespace benefactor::schema
