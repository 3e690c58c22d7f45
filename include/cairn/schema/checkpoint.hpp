#pragma once

#include <cairn/schema/peak.hpp>
#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: checkpoint.
// Accumulator state as of the end of one block height in which at least one
// leaf was appended. Immutable once the block commits.
namespace cairn::schema {

template <uint16_t Version>
struct checkpoint;

template <>
struct checkpoint<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint64_t leaf_count{};
  std::vector<peak_t> peaks;

  bool operator==(const checkpoint&) const = default;
};

using checkpoint_t = checkpoint<1>;

}  // namespace cairn::schema
