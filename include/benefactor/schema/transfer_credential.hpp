#pragma once
#include <benefactor/schema/primitives.hpp>

// Schema type: transfer credential.
// Donation workflow: ownership change request for a reputation credential.
// Credentials are soulbound, so every such request is refused.
namespace benefactor::schema {

template <uint16_t Version>
struct transfer_credential;

template <>
struct transfer_credential<1> final {
  uint16_t version{1};
  credential_id_t credential_id{};
  account_id_t from{};
  account_id_t to{};
};

using transfer_credential_t = transfer_credential<1>;

}  // namespace benefactor::schema
