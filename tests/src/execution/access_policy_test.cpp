#include <benefactor/execution/access_policy.hpp>
#include <benefactor/testing/common.hpp>
#include <gtest/gtest.h>

using benefactor::schema::privileged_action_t;
using benefactor::testing::make_account;

TEST(access_policy, single_owner_accepts_only_the_owner) {
  auto policy = benefactor::execution::single_owner_policy{make_account(1)};
  EXPECT_TRUE(policy.authorize(privileged_action_t::verify_charity,
                               make_account(1), {}));
  EXPECT_FALSE(policy.authorize(privileged_action_t::verify_charity,
                                make_account(2), {make_account(1)}));
  EXPECT_EQ(policy.name(), "single-owner");
}

TEST(access_policy, multisig_counts_distinct_members) {
  auto policy = benefactor::execution::multisig_policy{
      {make_account(1), make_account(2), make_account(3)}, 2};

  EXPECT_FALSE(policy.authorize(privileged_action_t::set_token_support,
                                make_account(1), {}));
  EXPECT_FALSE(policy.authorize(privileged_action_t::set_token_support,
                                make_account(1),
                                {make_account(1), make_account(1)}));
  EXPECT_FALSE(policy.authorize(privileged_action_t::set_token_support,
                                make_account(1), {make_account(9)}));
  EXPECT_TRUE(policy.authorize(privileged_action_t::set_token_support,
                               make_account(1), {make_account(3)}));
  // The signer need not be a member when enough co-signers are.
  EXPECT_TRUE(policy.authorize(privileged_action_t::emergency_withdraw,
                               make_account(9),
                               {make_account(2), make_account(3)}));
}

TEST(access_policy, role_based_checks_the_action_grant) {
  auto grants = benefactor::execution::role_based_policy::grants_t{};
  grants[privileged_action_t::verify_charity].insert(make_account(1));
  grants[privileged_action_t::emergency_withdraw].insert(make_account(2));
  auto policy = benefactor::execution::role_based_policy{grants};

  EXPECT_TRUE(policy.authorize(privileged_action_t::verify_charity,
                               make_account(1), {}));
  EXPECT_FALSE(policy.authorize(privileged_action_t::emergency_withdraw,
                                make_account(1), {}));
  EXPECT_TRUE(policy.authorize(privileged_action_t::emergency_withdraw,
                               make_account(2), {}));
  EXPECT_FALSE(policy.authorize(privileged_action_t::set_token_support,
                                make_account(1), {make_account(2)}));
}
