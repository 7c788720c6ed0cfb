#include <benefactor/execution/credential_descriptor.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/reputation_tier.hpp>

#include <string>

namespace benefactor::execution {

namespace {

boost::json::object make_trait(const std::string_view trait_type,
                               boost::json::value value) {
  auto trait = boost::json::object{};
  trait["trait_type"] = std::string{trait_type};
  trait["value"] = std::move(value);
  return trait;
}

}  // namespace

boost::json::object make_credential_descriptor(
    const benefactor::schema::credential_state_t& credential) {
  auto attributes = boost::json::array{};
  attributes.emplace_back(make_trait(
      "Tier", boost::json::string{std::string{
                  benefactor::schema::display_name(credential.tier)}}));
  // Amounts can exceed 2^64, so the total travels as a decimal string.
  attributes.emplace_back(make_trait(
      "Total Donated",
      boost::json::string{
          benefactor::schema::to_string(credential.total_donated)}));
  attributes.emplace_back(
      make_trait("Donation Count", credential.donation_count));

  auto descriptor = boost::json::object{};
  descriptor["name"] =
      "Benefactor Reputation #" + std::to_string(credential.credential_id);
  descriptor["description"] =
      "Non-transferable reputation credential tracking a donor's giving.";
  descriptor["image"] = credential.metadata_ref;
  descriptor["attributes"] = std::move(attributes);
  return descriptor;
}

std::string make_credential_uri(
    const benefactor::schema::credential_state_t& credential) {
  auto json = boost::json::serialize(make_credential_descriptor(credential));
  return std::string{kCredentialDescriptorUriPrefix} +
         benefactor::schema::to_base64(
             benefactor::schema::make_bytes_view(json));
}

}  // namespace benefactor::execution
