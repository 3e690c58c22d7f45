#pragma once

#include <cairn/mmr/mountain_range.hpp>
#include <cairn/mmr/snapshot_store.hpp>
#include <cairn/schema/accumulator_state.hpp>
#include <cairn/schema/checkpoint.hpp>
#include <cairn/schema/primitives.hpp>
#include <cstdint>

namespace cairn::mmr {

/// One accumulator machine: immutable metadata, its mountain range and the
/// per-height checkpoint log.
///
/// Leaf payloads are not held here; the engine persists them as leaf rows and
/// reads them back from storage. `append` merges the commitment and records
/// the checkpoint in one step. Callers that need all-or-nothing semantics
/// check `can_write` before calling it.
class accumulator final {
 public:
  explicit accumulator(cairn::schema::accumulator_state_t state);

  const cairn::schema::accumulator_state_t& state() const;
  cairn::schema::address_t address() const;

  /// Append the leaf commitment `commitment` during block `height`.
  append_result append(uint64_t height,
                       const cairn::schema::hash32_t& commitment);

  /// Head state, including appends that are not committed yet.
  const mountain_range& range() const;

  /// State as of the end of block `height`.
  cairn::schema::checkpoint_t at(uint64_t height) const;

  const snapshot_store& snapshots() const;

  /// Startup reload. Checkpoints must arrive in height order;
  /// `finish_restore` then rebuilds the range from the latest checkpoint.
  bool restore_checkpoint(cairn::schema::checkpoint_t checkpoint);
  bool finish_restore();

 private:
  cairn::schema::accumulator_state_t state_;
  mountain_range range_;
  snapshot_store snapshots_;
};

}  // namespace cairn::mmr
