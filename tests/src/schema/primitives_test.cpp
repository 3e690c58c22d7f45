#include <gtest/gtest.h>
#include <cairn/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_copies_bytes) {
  auto input = cairn::schema::bytes_t(32, 0xAB);
  auto hash = cairn::schema::make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = cairn::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(cairn::schema::try_make_hash32(std::string_view{"abcd"})
                   .has_value());
  EXPECT_FALSE(cairn::schema::try_make_hash32(std::string(65, 'a')).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  for (auto byte : cairn::schema::make_zero_hash()) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_encodes_lowercase_and_decodes_either_case) {
  auto bytes = cairn::schema::bytes_t{0x00, 0xAB, 0xff};
  EXPECT_EQ(cairn::schema::to_hex(bytes), "00abff");
  EXPECT_EQ(cairn::schema::from_hex("00ABff"), bytes);
  EXPECT_EQ(cairn::schema::from_hex("0x00abff"), bytes);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(cairn::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(cairn::schema::try_from_hex("zz").has_value());
  EXPECT_TRUE(cairn::schema::try_from_hex("")->empty());
}

TEST(primitives, base64_matches_rfc4648_vectors) {
  EXPECT_EQ(cairn::schema::to_base64(cairn::schema::make_bytes(
                std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(cairn::schema::to_base64(cairn::schema::make_bytes(
                std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(cairn::schema::to_base64(cairn::schema::make_bytes(
                std::string_view{"foobar"})),
            "Zm9vYmFy");
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = cairn::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  EXPECT_EQ(cairn::schema::from_base64(cairn::schema::to_base64(payload)),
            payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(cairn::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(cairn::schema::try_from_base64("Zg=a").has_value());
  EXPECT_FALSE(cairn::schema::try_from_base64("Zg==Zg==").has_value());
}
