#include <benefactor/config/options.hpp>
#include <benefactor/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

using benefactor::schema::privileged_action_t;
using benefactor::schema::to_hex;
using benefactor::testing::make_account;

namespace {

benefactor::config::cli_options parse(std::vector<std::string> args) {
  args.insert(std::begin(args), "benefactor");
  auto argv = std::vector<const char*>{};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return benefactor::config::parse_options(static_cast<int>(argv.size()),
                                           argv.data());
}

}  // namespace

TEST(options, defaults_without_arguments) {
  auto options = parse({});
  EXPECT_FALSE(options.help);
  EXPECT_FALSE(options.verbose);
  EXPECT_EQ(options.db_path, "benefactor.db");
  EXPECT_EQ(options.log_file, "benefactor.log");
  EXPECT_EQ(options.policy.kind, "single-owner");
  EXPECT_EQ(options.policy.multisig_threshold, 1u);
  EXPECT_TRUE(options.command.empty());
  EXPECT_TRUE(options.arguments.empty());
}

TEST(options, command_and_positional_arguments) {
  auto signer = to_hex(make_account(0x21));
  auto options =
      parse({"--signer", signer, "-v", "donate", "aa", "bb", "100", "hello"});
  EXPECT_TRUE(options.verbose);
  EXPECT_EQ(options.signer, make_account(0x21));
  EXPECT_EQ(options.command, "donate");
  EXPECT_EQ(options.arguments,
            (std::vector<std::string>{"aa", "bb", "100", "hello"}));
}

TEST(options, repeated_co_signers_accumulate) {
  auto options = parse({"--co-signer", to_hex(make_account(1)), "--co-signer",
                        "0x" + to_hex(make_account(2)), "info"});
  EXPECT_EQ(options.co_signers,
            (std::vector<benefactor::schema::account_id_t>{make_account(1),
                                                           make_account(2)}));
}

TEST(options, malformed_identity_is_rejected) {
  EXPECT_THROW(parse({"--signer", "abc"}), po::error);
  EXPECT_THROW(parse({"--custody", std::string(64, 'z')}), po::error);
  EXPECT_THROW(parse({"--no-such-option"}), po::error);
}

TEST(options, config_file_supplies_defaults) {
  auto path = benefactor::testing::make_db_path("benefactor_options") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "db=from-config.db\n"
         << "log-file=from-config.log\n"
         << "policy=multisig\n"
         << "multisig-member=" << to_hex(make_account(1)) << "\n"
         << "multisig-member=" << to_hex(make_account(2)) << "\n"
         << "multisig-threshold=2\n";
  }

  auto options = parse({"--config", path, "--db", "from-cli.db", "info"});
  EXPECT_EQ(options.db_path, "from-cli.db");
  EXPECT_EQ(options.log_file, "from-config.log");
  EXPECT_EQ(options.policy.kind, "multisig");
  EXPECT_EQ(options.policy.multisig_members.size(), 2u);
  EXPECT_EQ(options.policy.multisig_threshold, 2u);
  benefactor::testing::remove_path(path);

  EXPECT_THROW(parse({"--config", path}), po::error);
}

TEST(options, single_owner_policy_requires_owner) {
  auto policy = benefactor::config::policy_options{};
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);

  policy.owner = to_hex(make_account(0xA0));
  auto built = benefactor::config::make_access_policy(policy);
  ASSERT_NE(built, nullptr);
  EXPECT_EQ(built->name(), "single-owner");
  EXPECT_TRUE(built->authorize(privileged_action_t::verify_charity,
                               make_account(0xA0), {}));
}

TEST(options, multisig_threshold_is_bounded_by_members) {
  auto policy = benefactor::config::policy_options{};
  policy.kind = "multisig";
  policy.multisig_members = {to_hex(make_account(1)), to_hex(make_account(1)),
                             to_hex(make_account(2))};
  policy.multisig_threshold = 3;
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);

  policy.multisig_threshold = 0;
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);

  policy.multisig_threshold = 2;
  auto built = benefactor::config::make_access_policy(policy);
  EXPECT_EQ(built->name(), "multisig");
  EXPECT_TRUE(built->authorize(privileged_action_t::emergency_withdraw,
                               make_account(1), {make_account(2)}));
}

TEST(options, role_grants_parse_action_and_identity) {
  auto policy = benefactor::config::policy_options{};
  policy.kind = "roles";
  policy.roles = {"verify_charity=" + to_hex(make_account(5))};
  auto built = benefactor::config::make_access_policy(policy);
  EXPECT_EQ(built->name(), "roles");
  EXPECT_TRUE(built->authorize(privileged_action_t::verify_charity,
                               make_account(5), {}));
  EXPECT_FALSE(built->authorize(privileged_action_t::set_token_support,
                                make_account(5), {}));

  policy.roles = {"mint_everything=" + to_hex(make_account(5))};
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);
  policy.roles = {"verify_charity"};
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);
}

TEST(options, unknown_policy_kind_is_rejected) {
  auto policy = benefactor::config::policy_options{};
  policy.kind = "anarchy";
  EXPECT_THROW(benefactor::config::make_access_policy(policy), po::error);
}

TEST(options, custody_is_required_to_run_the_engine) {
  EXPECT_THROW(benefactor::config::require_custody(parse({"info"})),
               po::error);

  auto options = parse({"--custody", to_hex(make_account(0xC0)), "info"});
  EXPECT_EQ(benefactor::config::require_custody(options), make_account(0xC0));
}
