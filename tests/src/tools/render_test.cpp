#include <benefactor/schema/transaction_event.hpp>
#include <benefactor/testing/common.hpp>
#include <benefactor/tools/render.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace benefactor::schema;
using benefactor::testing::make_account;
using benefactor::testing::make_hash;

TEST(render, charity_uses_hex_and_decimal_strings) {
  auto charity = charity_state_t{};
  charity.charity_id = make_account(0x11);
  charity.name = "Helpers";
  charity.verified = true;
  charity.total_donations = amount_t{1} << 100;
  charity.donor_count = 3;

  auto json = benefactor::tools::render(charity);
  EXPECT_EQ(json.at("charity_id").as_string(), to_hex(make_account(0x11)));
  EXPECT_EQ(json.at("name").as_string(), "Helpers");
  EXPECT_TRUE(json.at("verified").as_bool());
  EXPECT_EQ(json.at("total_donations").as_string(),
            "1267650600228229401496703205376");
  EXPECT_EQ(json.at("donor_count").as_uint64(), 3u);
}

TEST(render, credential_shows_tier_display_name) {
  auto credential = credential_state_t{};
  credential.credential_id = 1;
  credential.owner = make_account(0x21);
  credential.total_donated = 550;
  credential.donation_count = 2;
  credential.tier = reputation_tier_t::silver;

  auto json = benefactor::tools::render(credential);
  EXPECT_EQ(json.at("tier").as_string(), "Silver");
  EXPECT_EQ(json.at("total_donated").as_string(), "550");
  EXPECT_EQ(json.at("credential_id").as_uint64(), 1u);
}

TEST(render, donation_record_fields) {
  auto donation = donation_record_t{};
  donation.donation_id = 4;
  donation.token_id = make_hash(0x40);
  donation.amount = 99;
  donation.message = "for the shelter";

  auto json = benefactor::tools::render(donation);
  EXPECT_EQ(json.at("donation_id").as_uint64(), 4u);
  EXPECT_EQ(json.at("token_id").as_string(), to_hex(make_hash(0x40)));
  EXPECT_EQ(json.at("amount").as_string(), "99");
  EXPECT_EQ(json.at("message").as_string(), "for the shelter");
}

TEST(render, transaction_result_lists_events) {
  auto result = transaction_result_t{};
  result.code = 0;
  result.sequence = 5;
  result.data = bytes_t{0x0a, 0xff};
  result.events.push_back(make_event(
      event_type_t::charity_verified,
      {{.key = "charity_id", .value = "abc", .index = true}}));

  auto json = benefactor::tools::render(result);
  EXPECT_EQ(json.at("sequence").as_uint64(), 5u);
  EXPECT_EQ(json.at("data").as_string(), "0aff");
  const auto& events = json.at("events").as_array();
  ASSERT_EQ(events.size(), 1u);
  const auto& event = events[0].as_object();
  EXPECT_EQ(event.at("type").as_string(), "charity_verified");
  EXPECT_EQ(event.at("attributes").as_object().at("charity_id").as_string(),
            "abc");
}

TEST(render, id_lists_serialize_as_arrays) {
  EXPECT_EQ(benefactor::tools::to_json(
                benefactor::tools::render(std::vector<uint64_t>{0, 3})),
            "[0,3]");
  EXPECT_EQ(benefactor::tools::to_json(
                benefactor::tools::render(std::vector<uint64_t>{})),
            "[]");
}
