#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace benefactor::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  authorization_denied = 3,
  reentrant_call = 4,
  invalid_amount = 10,
  charity_not_registered = 11,
  charity_not_verified = 12,
  charity_already_registered = 13,
  already_verified = 14,
  token_not_supported = 15,
  token_not_transferable = 16,
  token_already_minted = 17,
  invalid_metadata = 18,
  invalid_address = 19,
  transfer_failed = 20,
  credential_missing = 21,
};

std::string_view to_string(transaction_error_code value);

/// Error category named "benefactor.tx"; messages are the snake_case names.
const std::error_category& transaction_error_category() noexcept;

std::error_code make_error_code(transaction_error_code value) noexcept;

}  // namespace benefactor::schema

template <>
struct std::is_error_code_enum<benefactor::schema::transaction_error_code>
    : std::true_type {};
