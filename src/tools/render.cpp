#include <benefactor/schema/reputation_tier.hpp>
#include <benefactor/tools/render.hpp>

namespace benefactor::tools {

boost::json::object render(const benefactor::schema::charity_state_t& charity) {
  auto out = boost::json::object{};
  out["charity_id"] = benefactor::schema::to_hex(charity.charity_id);
  out["name"] = charity.name;
  out["description"] = charity.description;
  out["metadata_ref"] = charity.metadata_ref;
  out["verified"] = charity.verified;
  out["total_donations"] =
      benefactor::schema::to_string(charity.total_donations);
  out["donor_count"] = charity.donor_count;
  out["created_at"] = charity.created_at;
  out["updated_at"] = charity.updated_at;
  return out;
}

boost::json::object render(
    const benefactor::schema::donation_record_t& donation) {
  auto out = boost::json::object{};
  out["donation_id"] = donation.donation_id;
  out["donor"] = benefactor::schema::to_hex(donation.donor);
  out["charity_id"] = benefactor::schema::to_hex(donation.charity_id);
  out["amount"] = benefactor::schema::to_string(donation.amount);
  out["token_id"] = benefactor::schema::to_hex(donation.token_id);
  out["message"] = donation.message;
  out["donated_at"] = donation.donated_at;
  return out;
}

boost::json::object render(
    const benefactor::schema::credential_state_t& credential) {
  auto out = boost::json::object{};
  out["credential_id"] = credential.credential_id;
  out["owner"] = benefactor::schema::to_hex(credential.owner);
  out["total_donated"] =
      benefactor::schema::to_string(credential.total_donated);
  out["donation_count"] = credential.donation_count;
  out["tier"] = std::string{benefactor::schema::display_name(credential.tier)};
  out["last_donation_at"] = credential.last_donation_at;
  out["metadata_ref"] = credential.metadata_ref;
  return out;
}

boost::json::object render(
    const benefactor::schema::transaction_result_t& result) {
  auto events = boost::json::array{};
  for (const auto& event : result.events) {
    auto attributes = boost::json::object{};
    for (const auto& attribute : event.attributes) {
      attributes[attribute.key] = attribute.value;
    }
    auto rendered = boost::json::object{};
    rendered["type"] = event.type;
    rendered["attributes"] = std::move(attributes);
    events.emplace_back(std::move(rendered));
  }

  auto out = boost::json::object{};
  out["code"] = result.code;
  out["log"] = result.log;
  out["info"] = result.info;
  out["codespace"] = result.codespace;
  out["sequence"] = result.sequence;
  out["data"] = benefactor::schema::to_hex(benefactor::schema::bytes_view_t{
      result.data.data(), result.data.size()});
  out["events"] = std::move(events);
  return out;
}

boost::json::object render(const benefactor::schema::app_info_t& info) {
  auto out = boost::json::object{};
  out["data"] = info.data;
  out["version"] = info.version;
  out["last_sequence"] = info.last_sequence;
  out["state_root"] = benefactor::schema::to_hex(info.state_root);
  return out;
}

boost::json::array render(const std::vector<uint64_t>& ids) {
  auto out = boost::json::array{};
  for (const auto id : ids) {
    out.emplace_back(id);
  }
  return out;
}

std::string to_json(const boost::json::value& value) {
  return boost::json::serialize(value);
}

}  // namespace benefactor::tools
