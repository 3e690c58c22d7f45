#pragma once

#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for accumulator state. Integer key
// components are big endian so RocksDB iteration order matches numeric order.
namespace cairn::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccumulatorKeyPrefix{
    "SYS|STATE|ACCUMULATOR|"};
inline constexpr std::string_view kLeafKeyPrefix{"SYS|STATE|LEAF|"};
inline constexpr std::string_view kCheckpointKeyPrefix{
    "SYS|STATE|CHECKPOINT|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kNextAddressKey{"SYS|STATE|NEXT_ADDRESS"};
inline constexpr std::string_view kCommittedHeightKey{
    "SYS|APP|COMMITTED_HEIGHT"};
inline constexpr std::string_view kChainIdKey{"SYS|APP|CHAIN_ID"};

cairn::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const cairn::schema::bytes_t& id);

cairn::schema::bytes_t make_accumulator_key(cairn::schema::address_t address);

cairn::schema::bytes_t make_leaf_key(cairn::schema::address_t address,
                                     uint64_t index);

/// Prefix covering every leaf of one accumulator.
cairn::schema::bytes_t make_leaf_prefix_key(cairn::schema::address_t address);

cairn::schema::bytes_t make_checkpoint_key(cairn::schema::address_t address,
                                           uint64_t height);

cairn::schema::bytes_t make_checkpoint_prefix_key(
    cairn::schema::address_t address);

template <typename Encoder>
cairn::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const cairn::schema::signer_id_t& signer) {
  return make_prefixed_key(kNonceKeyPrefix, encoder.encode(signer));
}

std::optional<cairn::schema::address_t> parse_accumulator_key(
    const cairn::schema::bytes_view_t& key);

/// (address, index) of a leaf key.
std::optional<std::pair<cairn::schema::address_t, uint64_t>> parse_leaf_key(
    const cairn::schema::bytes_view_t& key);

/// (address, height) of a checkpoint key.
std::optional<std::pair<cairn::schema::address_t, uint64_t>>
parse_checkpoint_key(const cairn::schema::bytes_view_t& key);

}  // namespace cairn::schema::key
