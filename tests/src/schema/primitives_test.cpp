#include <quorum/schema/pending_status.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_status.hpp>
#include <gtest/gtest.h>

#include <string>

TEST(primitives, hex_accepts_prefix_and_rejects_odd_length) {
  auto decoded = quorum::schema::try_from_hex("0xA0ff");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (quorum::schema::bytes_t{0xA0, 0xFF}));
  EXPECT_EQ(quorum::schema::to_hex(*decoded), "a0ff");

  EXPECT_FALSE(quorum::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(quorum::schema::try_from_hex("zz").has_value());
}

TEST(primitives, address_accepts_network_prefixed_form) {
  auto plain = std::string(40, 'a');
  auto address = quorum::schema::try_make_address(plain);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->front(), 0xAA);

  auto prefixed = quorum::schema::try_make_address("41" + plain);
  ASSERT_TRUE(prefixed.has_value());
  EXPECT_EQ(*prefixed, *address);

  EXPECT_FALSE(quorum::schema::try_make_address("42" + plain).has_value());
  EXPECT_FALSE(quorum::schema::try_make_address("aabb").has_value());
}

TEST(primitives, amount_parses_full_256_bit_range) {
  auto max = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935"};
  auto amount = quorum::schema::try_make_amount(max);
  ASSERT_TRUE(amount.has_value());
  EXPECT_EQ(amount->str(), max);

  // 2^256 overflows.
  max.back() = '6';
  EXPECT_FALSE(quorum::schema::try_make_amount(max).has_value());
  EXPECT_FALSE(quorum::schema::try_make_amount("").has_value());
  EXPECT_FALSE(quorum::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(quorum::schema::try_make_amount("1.5").has_value());
}

TEST(primitives, base64_matches_reference_vectors) {
  auto text = quorum::schema::make_bytes(std::string_view{"foobar"});
  EXPECT_EQ(quorum::schema::to_base64(text), "Zm9vYmFy");
  EXPECT_EQ(quorum::schema::to_base64(quorum::schema::make_bytes(
                std::string_view{"fo"})),
            "Zm8=");

  auto decoded = quorum::schema::try_from_base64("Zm9v\nYg==");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(quorum::schema::make_string(*decoded), "foob");

  EXPECT_FALSE(quorum::schema::try_from_base64("Zm9").has_value());
  EXPECT_FALSE(quorum::schema::try_from_base64("Z=9v").has_value());
}

TEST(primitives, status_strings) {
  using quorum::schema::pending_status_t;
  using quorum::schema::proposal_status_t;
  EXPECT_EQ(quorum::schema::to_string(pending_status_t::ready), "ready");
  EXPECT_EQ(
      quorum::schema::try_from_string<pending_status_t>("broadcast"),
      pending_status_t::broadcast);
  EXPECT_FALSE(
      quorum::schema::try_from_string<pending_status_t>("done").has_value());
  EXPECT_TRUE(quorum::schema::is_terminal(pending_status_t::failed));
  EXPECT_FALSE(quorum::schema::is_terminal(pending_status_t::ready));

  EXPECT_EQ(quorum::schema::to_string(proposal_status_t::cancelled),
            "cancelled");
  EXPECT_FALSE(quorum::schema::is_terminal(proposal_status_t::open));
}
