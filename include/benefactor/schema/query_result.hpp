#pragma once

#include <benefactor/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Donation workflow: read API envelope returning the SCALE-encoded record for
// a route and key, or a query error code.
namespace benefactor::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  bytes_t key;
  bytes_t value;
  uint64_t sequence{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace benefactor::schema
