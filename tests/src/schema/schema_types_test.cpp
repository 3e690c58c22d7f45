#include <cairn/schema/broadcast_mode.hpp>
#include <cairn/schema/encoding/scale/encoder.hpp>
#include <cairn/schema/encoding/signing.hpp>
#include <cairn/schema/query_height.hpp>
#include <cairn/schema/transaction.hpp>
#include <cairn/schema/write_access.hpp>
#include <cairn/testing/common.hpp>
#include <gtest/gtest.h>

#include <tuple>

namespace {

using encoder_t = cairn::schema::encoding::scale_encoder_t;

cairn::schema::transaction_t make_push_tx() {
  return cairn::schema::transaction_t{
      .version = 1,
      .chain_id = cairn::testing::make_hash(1),
      .nonce = 3,
      .signer = cairn::testing::make_named_signer(2),
      .payload = cairn::schema::push_t{.address = 4,
                                       .payload = {0xDE, 0xAD}},
      .signature = cairn::schema::ed25519_signature_t{}};
}

}  // namespace

TEST(schema_types, write_access_strings) {
  EXPECT_EQ(cairn::schema::try_from_string<cairn::schema::write_access_t>(
                "public"),
            cairn::schema::write_access_t::public_write);
  EXPECT_EQ(cairn::schema::try_from_string<cairn::schema::write_access_t>(
                "only_owner"),
            cairn::schema::write_access_t::only_owner);
  EXPECT_FALSE(cairn::schema::try_from_string<cairn::schema::write_access_t>(
                   "everyone")
                   .has_value());
  EXPECT_EQ(cairn::schema::to_string(
                cairn::schema::write_access_t::public_write),
            "public");
}

TEST(schema_types, broadcast_mode_selects_rpc_method) {
  auto mode =
      cairn::schema::try_from_string<cairn::schema::broadcast_mode_t>("sync");
  ASSERT_TRUE(mode.has_value());
  EXPECT_EQ(cairn::schema::rpc_method(*mode), "broadcast_tx_sync");
  EXPECT_EQ(cairn::schema::rpc_method(cairn::schema::broadcast_mode_t::async),
            "broadcast_tx_async");
  EXPECT_EQ(
      cairn::schema::rpc_method(cairn::schema::broadcast_mode_t::commit),
      "broadcast_tx_commit");
}

TEST(schema_types, query_height_parses_keywords_and_numbers) {
  EXPECT_EQ(cairn::schema::try_parse_query_height("committed"),
            cairn::schema::query_height_t::committed());
  EXPECT_EQ(cairn::schema::try_parse_query_height("pending"),
            cairn::schema::query_height_t::pending());
  EXPECT_EQ(cairn::schema::try_parse_query_height("17"),
            cairn::schema::query_height_t::at(17));
  EXPECT_FALSE(cairn::schema::try_parse_query_height("").has_value());
  EXPECT_FALSE(cairn::schema::try_parse_query_height("-1").has_value());
  EXPECT_FALSE(cairn::schema::try_parse_query_height("12ab").has_value());
}

TEST(schema_types, transaction_scale_round_trip_preserves_payload) {
  auto encoder = encoder_t{};
  auto tx = make_push_tx();
  auto encoded = encoder.encode(tx);
  auto decoded = encoder.try_decode<cairn::schema::transaction_t>(
      cairn::testing::as_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->nonce, 3u);
  EXPECT_EQ(decoded->signer, tx.signer);
  const auto* push = std::get_if<cairn::schema::push_t>(&decoded->payload);
  ASSERT_NE(push, nullptr);
  EXPECT_EQ(push->address, 4u);
  EXPECT_EQ(push->payload, (cairn::schema::bytes_t{0xDE, 0xAD}));
}

TEST(schema_types, try_decode_rejects_truncated_transaction) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_push_tx());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<cairn::schema::transaction_t>(
                       cairn::testing::as_view(encoded))
                   .has_value());
}

TEST(schema_types, signing_bytes_exclude_signature) {
  auto encoder = encoder_t{};
  auto tx = make_push_tx();
  auto unsigned_bytes = cairn::schema::encoding::signing_bytes(encoder, tx);
  tx.signature = cairn::schema::ed25519_signature_t{0x01};
  EXPECT_EQ(cairn::schema::encoding::signing_bytes(encoder, tx),
            unsigned_bytes);
  tx.nonce = 4;
  EXPECT_NE(cairn::schema::encoding::signing_bytes(encoder, tx),
            unsigned_bytes);
}
