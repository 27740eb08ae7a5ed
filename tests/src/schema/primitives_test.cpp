#include <gtest/gtest.h>
#include <syndicate/schema/primitives.hpp>

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = syndicate::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_and_malformed_hex) {
  EXPECT_FALSE(syndicate::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(syndicate::schema::try_from_hex("0g").has_value());
  EXPECT_FALSE(syndicate::schema::try_from_hex("abc").has_value());
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = syndicate::schema::bytes_t{0x00, 0x7F, 0x80, 0xFE, 0xFF};
  auto encoded = syndicate::schema::to_hex(payload);
  EXPECT_EQ(encoded, "007f80feff");
  EXPECT_EQ(syndicate::schema::try_from_hex(encoded), payload);
}

TEST(primitives, null_identity_is_the_zero_hash) {
  EXPECT_TRUE(
      syndicate::schema::is_null(syndicate::schema::null_identity()));
  auto identity = syndicate::schema::identity_t{};
  EXPECT_TRUE(syndicate::schema::is_null(identity));
  identity[31] = 1;
  EXPECT_FALSE(syndicate::schema::is_null(identity));
}

TEST(primitives, amount_bytes_are_little_endian_and_lossless) {
  auto amount = syndicate::schema::amount_t{0x0102};
  auto bytes = syndicate::schema::to_amount_bytes(amount);
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[31], 0x00);

  auto max = syndicate::schema::unlimited_amount();
  EXPECT_EQ(syndicate::schema::from_amount_bytes(
                syndicate::schema::to_amount_bytes(max)),
            max);
  EXPECT_EQ(syndicate::schema::from_amount_bytes(
                syndicate::schema::to_amount_bytes(0)),
            0);
}

TEST(primitives, amount_to_string_is_decimal) {
  EXPECT_EQ(syndicate::schema::to_string(syndicate::schema::amount_t{0}), "0");
  EXPECT_EQ(syndicate::schema::to_string(syndicate::schema::amount_t{999}),
            "999");
}
