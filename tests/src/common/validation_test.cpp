#include <quorum/common/validation.hpp>
#include <quorum/schema/transaction_error_code.hpp>
#include <quorum/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>

namespace {

using quorum::testing::make_address;

quorum::schema::custodian_roster_t make_roster(const uint32_t threshold) {
  return quorum::schema::custodian_roster_t{
      .version = 1,
      .custodians = {make_address(1), make_address(2), make_address(3)},
      .threshold = threshold};
}

}  // namespace

TEST(validation, transfer_checks_destination_before_amount) {
  using enum quorum::schema::transaction_error_code;
  EXPECT_EQ(quorum::common::validate_transfer(
                quorum::schema::make_zero_address(), 0),
            zero_address);
  EXPECT_EQ(quorum::common::validate_transfer(make_address(9), 0),
            zero_amount);
  EXPECT_FALSE(
      quorum::common::validate_transfer(make_address(9), 1).has_value());
}

TEST(validation, roster_bounds) {
  auto error = std::string{};
  EXPECT_TRUE(quorum::common::validate_roster(make_roster(1), error));
  EXPECT_TRUE(quorum::common::validate_roster(make_roster(3), error));

  EXPECT_FALSE(quorum::common::validate_roster(make_roster(0), error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(quorum::common::validate_roster(make_roster(4), error));

  auto empty = quorum::schema::custodian_roster_t{.threshold = 1};
  EXPECT_FALSE(quorum::common::validate_roster(empty, error));
}

TEST(validation, roster_rejects_zero_and_duplicate_custodians) {
  auto error = std::string{};
  auto duplicate = make_roster(2);
  duplicate.custodians.push_back(make_address(2));
  EXPECT_FALSE(quorum::common::validate_roster(duplicate, error));
  EXPECT_NE(error.find("duplicate"), std::string::npos);

  auto zero = make_roster(2);
  zero.custodians.push_back(quorum::schema::make_zero_address());
  EXPECT_FALSE(quorum::common::validate_roster(zero, error));
}

TEST(validation, expiry_is_strictly_after_deadline) {
  auto deadline = quorum::common::expiry_deadline(100, 50);
  EXPECT_EQ(deadline, 150u);
  EXPECT_FALSE(quorum::common::is_expired(deadline, 150));
  EXPECT_TRUE(quorum::common::is_expired(deadline, 151));
}

TEST(validation, expiry_deadline_saturates) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(quorum::common::expiry_deadline(kMax - 1, 10), kMax);
  EXPECT_FALSE(quorum::common::is_expired(kMax, kMax));
}

TEST(validation, error_categories) {
  using quorum::schema::error_category;
  using quorum::schema::error_category_of;
  using enum quorum::schema::transaction_error_code;
  EXPECT_EQ(error_category_of(0u), error_category::none);
  EXPECT_EQ(error_category_of(authorization_denied),
            error_category::authorization);
  EXPECT_EQ(error_category_of(proposal_missing), error_category::not_found);
  EXPECT_EQ(error_category_of(duplicate_approval),
            error_category::invalid_state);
  EXPECT_EQ(error_category_of(zero_amount), error_category::validation);
  EXPECT_EQ(error_category_of(insufficient_balance), error_category::resource);
  EXPECT_EQ(error_category_of(broadcast_rejected), error_category::transport);
}
