#pragma once

#include <benefactor/schema/app_info.hpp>
#include <benefactor/schema/charity_state.hpp>
#include <benefactor/schema/credential_state.hpp>
#include <benefactor/schema/donation_record.hpp>
#include <benefactor/schema/transaction_result.hpp>
#include <boost/json.hpp>
#include <string>
#include <vector>

// JSON views of ledger records for the command line. Identities and hashes
// are lowercase hex; amounts are decimal strings.
namespace benefactor::tools {

boost::json::object render(const benefactor::schema::charity_state_t& charity);
boost::json::object render(
    const benefactor::schema::donation_record_t& donation);
boost::json::object render(
    const benefactor::schema::credential_state_t& credential);
boost::json::object render(
    const benefactor::schema::transaction_result_t& result);
boost::json::object render(const benefactor::schema::app_info_t& info);
boost::json::array render(const std::vector<uint64_t>& ids);

std::string to_json(const boost::json::value& value);

}  // namespace benefactor::tools
