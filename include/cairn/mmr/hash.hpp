#pragma once

#include <cairn/schema/peak.hpp>
#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <span>

// Accumulator node commitments. BLAKE3-256 with a one-byte domain tag so a
// leaf can never collide with an interior node.
namespace cairn::mmr {

inline constexpr uint8_t kLeafDomainTag{0x00};
inline constexpr uint8_t kNodeDomainTag{0x01};

/// BLAKE3(0x00 || payload).
cairn::schema::hash32_t hash_leaf(const cairn::schema::bytes_view_t& payload);

/// BLAKE3(0x01 || left || right).
cairn::schema::hash32_t hash_node(const cairn::schema::hash32_t& left,
                                  const cairn::schema::hash32_t& right);

/// Fold an ordered peak list into a single root, seeded with the lowest peak
/// and folding right to left. No peaks yields the zero hash.
cairn::schema::hash32_t bag_peaks(
    std::span<const cairn::schema::peak_t> peaks);

}  // namespace cairn::mmr
