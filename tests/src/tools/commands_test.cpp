#include <benefactor/testing/common.hpp>
#include <benefactor/tools/commands.hpp>
#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace po = boost::program_options;

using namespace benefactor::schema;
using benefactor::testing::make_account;
using benefactor::testing::make_hash;
using benefactor::tools::build_payload;

TEST(commands, mutating_commands_are_recognised) {
  EXPECT_TRUE(benefactor::tools::is_mutating_command("donate"));
  EXPECT_TRUE(benefactor::tools::is_mutating_command("transfer-credential"));
  EXPECT_FALSE(benefactor::tools::is_mutating_command("show-charity"));
  EXPECT_FALSE(benefactor::tools::is_mutating_command("info"));
}

TEST(commands, donate_builds_payload) {
  auto payload = build_payload(
      "donate",
      {to_hex(make_account(0x11)), to_hex(make_hash(0x40)), "1500", "thanks"});
  ASSERT_TRUE(std::holds_alternative<donate_t>(payload));
  const auto& donate = std::get<donate_t>(payload);
  EXPECT_EQ(donate.charity_id, make_account(0x11));
  EXPECT_EQ(donate.token_id, make_hash(0x40));
  EXPECT_EQ(donate.amount, amount_t{1500});
  EXPECT_EQ(donate.message, "thanks");

  auto quiet = build_payload(
      "donate", {to_hex(make_account(0x11)), to_hex(make_hash(0x40)), "1"});
  EXPECT_TRUE(std::get<donate_t>(quiet).message.empty());
}

TEST(commands, register_and_verify_charity) {
  auto registered =
      build_payload("register-charity", {"Helpers", "We help", "ipfs://h"});
  const auto& payload = std::get<register_charity_t>(registered);
  EXPECT_EQ(payload.name, "Helpers");
  EXPECT_EQ(payload.description, "We help");
  EXPECT_EQ(payload.metadata_ref, "ipfs://h");

  auto verified =
      build_payload("verify-charity", {to_hex(make_account(0x11))});
  EXPECT_EQ(std::get<verify_charity_t>(verified).charity_id,
            make_account(0x11));
}

TEST(commands, token_support_flag_defaults_to_enabled) {
  auto token = to_hex(make_hash(0x40));
  EXPECT_TRUE(std::get<set_token_support_t>(
                  build_payload("set-token-support", {token}))
                  .supported);
  EXPECT_FALSE(std::get<set_token_support_t>(
                   build_payload("set-token-support", {token, "false"}))
                   .supported);
  EXPECT_THROW(build_payload("set-token-support", {token, "maybe"}),
               po::error);
}

TEST(commands, emergency_withdraw_token_is_optional) {
  auto native =
      build_payload("emergency-withdraw", {to_hex(make_account(0x33)), "25"});
  const auto& withdraw = std::get<emergency_withdraw_t>(native);
  EXPECT_FALSE(withdraw.token_id.has_value());
  EXPECT_EQ(withdraw.to, make_account(0x33));
  EXPECT_EQ(withdraw.amount, amount_t{25});

  auto token = build_payload(
      "emergency-withdraw",
      {to_hex(make_account(0x33)), "25", to_hex(make_hash(0x40))});
  EXPECT_EQ(std::get<emergency_withdraw_t>(token).token_id,
            std::optional<token_id_t>{make_hash(0x40)});
}

TEST(commands, transfer_credential_parses_id) {
  auto payload = build_payload(
      "transfer-credential",
      {"7", to_hex(make_account(0x21)), to_hex(make_account(0x22))});
  const auto& transfer = std::get<transfer_credential_t>(payload);
  EXPECT_EQ(transfer.credential_id, 7u);
  EXPECT_EQ(transfer.from, make_account(0x21));
  EXPECT_EQ(transfer.to, make_account(0x22));
}

TEST(commands, malformed_arguments_throw) {
  EXPECT_THROW(build_payload("donate", {}), po::error);
  EXPECT_THROW(build_payload("donate", {"xx", to_hex(make_hash(1)), "1"}),
               po::error);
  EXPECT_THROW(build_payload("donate", {to_hex(make_account(1)),
                                        to_hex(make_hash(1)), "-5"}),
               po::error);
  EXPECT_THROW(build_payload("register-charity", {"only-a-name"}), po::error);
  EXPECT_THROW(build_payload("launch-rocket", {}), po::error);
}

TEST(commands, amounts_cover_the_full_range) {
  EXPECT_EQ(benefactor::tools::parse_amount("0"), amount_t{0});
  auto max = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935"};
  EXPECT_EQ(benefactor::tools::parse_amount(max),
            std::numeric_limits<amount_t>::max());
  EXPECT_THROW(benefactor::tools::parse_amount(
                   "115792089237316195423570985008687907853269984665640564039"
                   "457584007913129639936"),
               po::error);
  EXPECT_THROW(benefactor::tools::parse_amount("12a"), po::error);
  EXPECT_THROW(benefactor::tools::parse_amount(""), po::error);
}

TEST(commands, ids_must_be_plain_decimal) {
  EXPECT_EQ(benefactor::tools::parse_id("42"), 42u);
  EXPECT_THROW(benefactor::tools::parse_id("42x"), po::error);
  EXPECT_THROW(benefactor::tools::parse_id(""), po::error);
  EXPECT_THROW(benefactor::tools::parse_id("99999999999999999999"), po::error);
}
