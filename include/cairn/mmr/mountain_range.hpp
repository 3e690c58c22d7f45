#pragma once

#include <cairn/schema/peak.hpp>
#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace cairn::mmr {

struct append_result final {
  uint64_t index{};
  cairn::schema::hash32_t root{};
};

/// Forest of perfect binary mountains over an append-only leaf sequence.
///
/// Peaks are kept highest mountain first. There is exactly one peak per set
/// bit of the leaf count, so an append touches at most log2(n) peaks and never
/// rehashes an existing mountain.
class mountain_range final {
 public:
  mountain_range() = default;

  /// Add a leaf commitment, merging equal-height trailing peaks. Returns the
  /// zero-based index of the new leaf and the root after the merge.
  append_result append(const cairn::schema::hash32_t& commitment);

  /// Peak commitments, highest mountain first.
  std::vector<cairn::schema::hash32_t> peaks() const;

  /// Peaks with their mountain heights, highest mountain first.
  const std::vector<cairn::schema::peak_t>& peak_entries() const;

  cairn::schema::hash32_t root() const;

  uint64_t count() const;

  /// Rebuild a range from a checkpoint. Returns nothing when the peak list
  /// does not match the binary decomposition of `leaf_count`.
  static std::optional<mountain_range> restore(
      uint64_t leaf_count,
      std::vector<cairn::schema::peak_t> peaks);

  static bool is_well_formed(uint64_t leaf_count,
                             const std::vector<cairn::schema::peak_t>& peaks);

 private:
  std::vector<cairn::schema::peak_t> peaks_;
  uint64_t leaf_count_{};
};

}  // namespace cairn::mmr
