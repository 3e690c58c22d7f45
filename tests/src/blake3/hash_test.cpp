#include <cairn/blake3/hash.hpp>
#include <cairn/testing/common.hpp>
#include <gtest/gtest.h>

#include <string_view>

TEST(blake3_hash, empty_input_matches_reference_vector) {
  EXPECT_EQ(cairn::testing::hex(cairn::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, abc_matches_reference_vector) {
  EXPECT_EQ(cairn::testing::hex(cairn::blake3::hash(std::string_view{"abc"})),
            "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST(blake3_hash, incremental_updates_match_one_shot) {
  auto hasher = cairn::blake3::hasher{};
  hasher.update(std::string_view{"a"});
  hasher.update(static_cast<uint8_t>('b'));
  auto tail = cairn::testing::make_payload("c");
  hasher.update(cairn::testing::as_view(tail));
  EXPECT_EQ(hasher.finalize(), cairn::blake3::hash(std::string_view{"abc"}));
}

TEST(blake3_hash, finalize_leaves_hasher_usable) {
  auto hasher = cairn::blake3::hasher{};
  hasher.update(std::string_view{"ab"});
  auto first = hasher.finalize();
  EXPECT_EQ(first, hasher.finalize());
  hasher.update(std::string_view{"c"});
  EXPECT_EQ(hasher.finalize(), cairn::blake3::hash(std::string_view{"abc"}));
}
