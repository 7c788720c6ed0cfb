#pragma once
#include <benefactor/schema/primitives.hpp>

namespace benefactor::schema {

template <uint16_t Version>
struct verify_charity;

template <>
struct verify_charity<1> final {
  uint16_t version{1};
  account_id_t charity_id{};
};

using verify_charity_t = verify_charity<1>;

}  // namespace benefactor::schema
