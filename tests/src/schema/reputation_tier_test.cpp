#include <gtest/gtest.h>
#include <benefactor/schema/reputation_tier.hpp>

using benefactor::schema::amount_t;
using benefactor::schema::reputation_tier_t;
using benefactor::schema::tier_for_total;

TEST(reputation_tier, thresholds_are_inclusive_lower_bounds) {
  EXPECT_EQ(tier_for_total(amount_t{0}), reputation_tier_t::bronze);
  EXPECT_EQ(tier_for_total(amount_t{499}), reputation_tier_t::bronze);
  EXPECT_EQ(tier_for_total(amount_t{500}), reputation_tier_t::silver);
  EXPECT_EQ(tier_for_total(amount_t{999}), reputation_tier_t::silver);
  EXPECT_EQ(tier_for_total(amount_t{1000}), reputation_tier_t::gold);
  EXPECT_EQ(tier_for_total(amount_t{4999}), reputation_tier_t::gold);
  EXPECT_EQ(tier_for_total(amount_t{5000}), reputation_tier_t::platinum);
  EXPECT_EQ(tier_for_total(amount_t{9999}), reputation_tier_t::platinum);
  EXPECT_EQ(tier_for_total(amount_t{10000}), reputation_tier_t::diamond);
}

TEST(reputation_tier, totals_beyond_64_bits_are_diamond) {
  auto huge = amount_t{1} << 200;
  EXPECT_EQ(tier_for_total(huge), reputation_tier_t::diamond);
}

TEST(reputation_tier, tiers_are_ordered) {
  EXPECT_LT(reputation_tier_t::bronze, reputation_tier_t::silver);
  EXPECT_LT(reputation_tier_t::silver, reputation_tier_t::gold);
  EXPECT_LT(reputation_tier_t::gold, reputation_tier_t::platinum);
  EXPECT_LT(reputation_tier_t::platinum, reputation_tier_t::diamond);
}

TEST(reputation_tier, names_map_both_ways) {
  EXPECT_EQ(benefactor::schema::display_name(reputation_tier_t::platinum),
            "Platinum");
  EXPECT_EQ(benefactor::schema::to_string(reputation_tier_t::gold), "gold");
  EXPECT_EQ(
      benefactor::schema::try_from_string<reputation_tier_t>("diamond"),
      reputation_tier_t::diamond);
  EXPECT_FALSE(
      benefactor::schema::try_from_string<reputation_tier_t>("Diamond"));
}
