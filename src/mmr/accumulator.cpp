#include <cairn/common/critical.hpp>
#include <cairn/mmr/accumulator.hpp>

#include <utility>

namespace cairn::mmr {

accumulator::accumulator(cairn::schema::accumulator_state_t state)
    : state_{std::move(state)} {}

const cairn::schema::accumulator_state_t& accumulator::state() const {
  return state_;
}

cairn::schema::address_t accumulator::address() const {
  return state_.address;
}

append_result accumulator::append(const uint64_t height,
                                  const cairn::schema::hash32_t& commitment) {
  auto result = range_.append(commitment);
  if (!snapshots_.record(height, range_.count(), range_.peak_entries())) {
    cairn::common::critical("accumulator append at a height below its latest "
                            "checkpoint");
  }
  return result;
}

const mountain_range& accumulator::range() const {
  return range_;
}

cairn::schema::checkpoint_t accumulator::at(const uint64_t height) const {
  return snapshots_.resolve(height);
}

const snapshot_store& accumulator::snapshots() const {
  return snapshots_;
}

bool accumulator::restore_checkpoint(cairn::schema::checkpoint_t checkpoint) {
  if (!mountain_range::is_well_formed(checkpoint.leaf_count,
                                      checkpoint.peaks)) {
    return false;
  }
  return snapshots_.restore(std::move(checkpoint));
}

bool accumulator::finish_restore() {
  auto latest = snapshots_.empty() ? cairn::schema::checkpoint_t{}
                                   : snapshots_.checkpoints().back();
  auto restored =
      mountain_range::restore(latest.leaf_count, std::move(latest.peaks));
  if (!restored) {
    return false;
  }
  range_ = std::move(*restored);
  return true;
}

}  // namespace cairn::mmr
