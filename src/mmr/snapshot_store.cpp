#include <cairn/mmr/snapshot_store.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace cairn::mmr {

bool snapshot_store::record(const uint64_t height,
                            const uint64_t leaf_count,
                            std::vector<cairn::schema::peak_t> peaks) {
  return restore(cairn::schema::checkpoint_t{
      .height = height, .leaf_count = leaf_count, .peaks = std::move(peaks)});
}

bool snapshot_store::restore(cairn::schema::checkpoint_t checkpoint) {
  if (!checkpoints_.empty()) {
    auto& latest = checkpoints_.back();
    if (checkpoint.height < latest.height) {
      return false;
    }
    if (checkpoint.height == latest.height) {
      latest = std::move(checkpoint);
      return true;
    }
  }
  checkpoints_.push_back(std::move(checkpoint));
  return true;
}

cairn::schema::checkpoint_t snapshot_store::resolve(
    const uint64_t height) const {
  auto it = std::upper_bound(
      std::begin(checkpoints_), std::end(checkpoints_), height,
      [](const uint64_t value, const cairn::schema::checkpoint_t& checkpoint) {
        return value < checkpoint.height;
      });
  if (it == std::begin(checkpoints_)) {
    return cairn::schema::checkpoint_t{};
  }
  return *std::prev(it);
}

const std::vector<cairn::schema::checkpoint_t>& snapshot_store::checkpoints()
    const {
  return checkpoints_;
}

bool snapshot_store::empty() const {
  return checkpoints_.empty();
}

}  // namespace cairn::mmr
