#pragma once

#include <benefactor/schema/credential_state.hpp>
#include <boost/json.hpp>
#include <string>
#include <string_view>

namespace benefactor::execution {

inline constexpr std::string_view kCredentialDescriptorUriPrefix{
    "data:application/json;base64,"};

/// Display document for a credential: name, description, image (the metadata
/// pointer) and tier/total/count attributes.
boost::json::object make_credential_descriptor(
    const benefactor::schema::credential_state_t& credential);

/// The descriptor serialized and wrapped in a base64 `data:` URI.
std::string make_credential_uri(
    const benefactor::schema::credential_state_t& credential);

}  // namespace benefactor::execution
