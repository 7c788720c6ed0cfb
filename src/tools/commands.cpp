#include <benefactor/config/options.hpp>
#include <benefactor/tools/commands.hpp>

#include <boost/program_options/errors.hpp>
#include <array>
#include <charconv>

namespace po = boost::program_options;

namespace benefactor::tools {

namespace {

constexpr auto kMutatingCommands = std::array<std::string_view, 6>{
    "register-charity", "verify-charity",     "set-token-support",
    "donate",           "emergency-withdraw", "transfer-credential"};

void require_arguments(const std::string_view command,
                       const std::vector<std::string>& arguments,
                       const size_t minimum,
                       const size_t maximum) {
  if (arguments.size() < minimum || arguments.size() > maximum) {
    throw po::error(std::string{command} + " expects " +
                    std::to_string(minimum) + ".." + std::to_string(maximum) +
                    " argument(s), got " + std::to_string(arguments.size()));
  }
}

bool parse_flag(const std::string& value) {
  if (value == "true" || value == "1" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "off") {
    return false;
  }
  throw po::invalid_option_value(value);
}

}  // namespace

bool is_mutating_command(const std::string_view command) {
  for (const auto candidate : kMutatingCommands) {
    if (candidate == command) {
      return true;
    }
  }
  return false;
}

benefactor::schema::amount_t parse_amount(const std::string& value) {
  auto amount = benefactor::schema::try_make_amount(value);
  if (!amount) {
    throw po::invalid_option_value("amount=" + value);
  }
  return *amount;
}

uint64_t parse_id(const std::string& value) {
  auto id = uint64_t{};
  auto [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), id);
  if (error != std::errc{} || end != value.data() + value.size()) {
    throw po::invalid_option_value("id=" + value);
  }
  return id;
}

benefactor::schema::transaction_payload_t build_payload(
    const std::string_view command,
    const std::vector<std::string>& arguments) {
  using benefactor::config::parse_identity;

  if (command == "register-charity") {
    require_arguments(command, arguments, 3, 3);
    return benefactor::schema::register_charity_t{
        .name = arguments[0],
        .description = arguments[1],
        .metadata_ref = arguments[2]};
  }
  if (command == "verify-charity") {
    require_arguments(command, arguments, 1, 1);
    return benefactor::schema::verify_charity_t{
        .charity_id = parse_identity("charity", arguments[0])};
  }
  if (command == "set-token-support") {
    require_arguments(command, arguments, 1, 2);
    return benefactor::schema::set_token_support_t{
        .token_id = parse_identity("token", arguments[0]),
        .supported = arguments.size() < 2 || parse_flag(arguments[1])};
  }
  if (command == "donate") {
    require_arguments(command, arguments, 3, 4);
    return benefactor::schema::donate_t{
        .charity_id = parse_identity("charity", arguments[0]),
        .token_id = parse_identity("token", arguments[1]),
        .amount = parse_amount(arguments[2]),
        .message = arguments.size() > 3 ? arguments[3] : std::string{}};
  }
  if (command == "emergency-withdraw") {
    require_arguments(command, arguments, 2, 3);
    auto token = std::optional<benefactor::schema::token_id_t>{};
    if (arguments.size() > 2) {
      token = parse_identity("token", arguments[2]);
    }
    return benefactor::schema::emergency_withdraw_t{
        .token_id = token,
        .to = parse_identity("to", arguments[0]),
        .amount = parse_amount(arguments[1])};
  }
  if (command == "transfer-credential") {
    require_arguments(command, arguments, 3, 3);
    return benefactor::schema::transfer_credential_t{
        .credential_id = parse_id(arguments[0]),
        .from = parse_identity("from", arguments[1]),
        .to = parse_identity("to", arguments[2])};
  }
  throw po::error("unknown command " + std::string{command});
}

}  // namespace benefactor::tools
