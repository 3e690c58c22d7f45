#pragma once

#include <cairn/schema/checkpoint.hpp>
#include <cairn/schema/peak.hpp>
#include <cstdint>
#include <vector>

namespace cairn::mmr {

/// Per-accumulator log of checkpoints, one per block height that appended at
/// least one leaf. Heights are strictly increasing.
class snapshot_store final {
 public:
  /// Record the state at `height`. A second record at the latest height
  /// replaces it. Returns false, recording nothing, when `height` is below
  /// the latest recorded height.
  bool record(uint64_t height,
              uint64_t leaf_count,
              std::vector<cairn::schema::peak_t> peaks);

  /// Latest checkpoint at or before `height`. Heights before the first
  /// checkpoint resolve to the empty state with height 0.
  cairn::schema::checkpoint_t resolve(uint64_t height) const;

  /// Reinsert a persisted checkpoint. Same ordering rule as `record`.
  bool restore(cairn::schema::checkpoint_t checkpoint);

  const std::vector<cairn::schema::checkpoint_t>& checkpoints() const;

  bool empty() const;

 private:
  std::vector<cairn::schema::checkpoint_t> checkpoints_;
};

}  // namespace cairn::mmr
