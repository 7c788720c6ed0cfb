#pragma once

#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Donation workflow: notification returned with a transaction result
// (donation made, credential minted or updated, charity verified, ...).
namespace benefactor::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  /// Value of the first attribute named `key`, if present.
  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

inline transaction_event_t make_event(
    const event_type_t type,
    std::vector<transaction_event_attribute_t> attributes) {
  return transaction_event_t{.version = 1,
                             .type = std::string{to_string(type)},
                             .attributes = std::move(attributes)};
}

}  // namespace benefactor::schema
