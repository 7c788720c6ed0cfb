#include <benefactor/schema/transaction_error_code.hpp>

#include <string>

namespace benefactor::schema {

namespace {

class transaction_error_category_impl final : public std::error_category {
 public:
  const char* name() const noexcept override { return "benefactor.tx"; }

  std::string message(int value) const override {
    return std::string{
        to_string(static_cast<transaction_error_code>(value))};
  }
};

}  // namespace

std::string_view to_string(const transaction_error_code value) {
  switch (value) {
    case transaction_error_code::invalid_transaction:
      return "invalid_transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported_transaction_version";
    case transaction_error_code::authorization_denied:
      return "authorization_denied";
    case transaction_error_code::reentrant_call:
      return "reentrant_call";
    case transaction_error_code::invalid_amount:
      return "invalid_amount";
    case transaction_error_code::charity_not_registered:
      return "charity_not_registered";
    case transaction_error_code::charity_not_verified:
      return "charity_not_verified";
    case transaction_error_code::charity_already_registered:
      return "charity_already_registered";
    case transaction_error_code::already_verified:
      return "already_verified";
    case transaction_error_code::token_not_supported:
      return "token_not_supported";
    case transaction_error_code::token_not_transferable:
      return "token_not_transferable";
    case transaction_error_code::token_already_minted:
      return "token_already_minted";
    case transaction_error_code::invalid_metadata:
      return "invalid_metadata";
    case transaction_error_code::invalid_address:
      return "invalid_address";
    case transaction_error_code::transfer_failed:
      return "transfer_failed";
    case transaction_error_code::credential_missing:
      return "credential_missing";
  }
  return "unknown";
}

const std::error_category& transaction_error_category() noexcept {
  static const auto category = transaction_error_category_impl{};
  return category;
}

std::error_code make_error_code(const transaction_error_code value) noexcept {
  return std::error_code{static_cast<int>(value),
                         transaction_error_category()};
}

}  // namespace benefactor::schema
