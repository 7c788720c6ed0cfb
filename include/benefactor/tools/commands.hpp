#pragma once

#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/transaction.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benefactor::tools {

/// True for commands that submit a transaction.
bool is_mutating_command(std::string_view command);

/// Payload for a mutating command and its positional arguments:
///
///   register-charity NAME DESCRIPTION METADATA_REF
///   verify-charity CHARITY
///   set-token-support TOKEN [true|false]
///   donate CHARITY TOKEN AMOUNT [MESSAGE]
///   emergency-withdraw TO AMOUNT [TOKEN]
///   transfer-credential CREDENTIAL_ID FROM TO
///
/// Identities are 64 hex characters and amounts are decimal. Throws
/// boost::program_options::error on malformed arguments.
benefactor::schema::transaction_payload_t build_payload(
    std::string_view command,
    const std::vector<std::string>& arguments);

benefactor::schema::amount_t parse_amount(const std::string& value);

uint64_t parse_id(const std::string& value);

}  // namespace benefactor::tools
