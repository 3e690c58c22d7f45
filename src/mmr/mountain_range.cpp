#include <cairn/mmr/hash.hpp>
#include <cairn/mmr/mountain_range.hpp>

#include <bit>
#include <iterator>
#include <utility>

namespace cairn::mmr {

append_result mountain_range::append(
    const cairn::schema::hash32_t& commitment) {
  auto index = leaf_count_;
  peaks_.push_back(cairn::schema::peak_t{.height = 0, .hash = commitment});
  while (peaks_.size() >= 2) {
    const auto& later = peaks_[peaks_.size() - 1];
    const auto& earlier = peaks_[peaks_.size() - 2];
    if (earlier.height != later.height) {
      break;
    }
    auto merged = cairn::schema::peak_t{
        .height = static_cast<uint8_t>(earlier.height + 1),
        .hash = hash_node(earlier.hash, later.hash)};
    peaks_.pop_back();
    peaks_.back() = merged;
  }
  ++leaf_count_;
  return append_result{.index = index, .root = root()};
}

std::vector<cairn::schema::hash32_t> mountain_range::peaks() const {
  auto out = std::vector<cairn::schema::hash32_t>{};
  out.reserve(peaks_.size());
  for (const auto& peak : peaks_) {
    out.push_back(peak.hash);
  }
  return out;
}

const std::vector<cairn::schema::peak_t>& mountain_range::peak_entries()
    const {
  return peaks_;
}

cairn::schema::hash32_t mountain_range::root() const {
  return bag_peaks(peaks_);
}

uint64_t mountain_range::count() const {
  return leaf_count_;
}

std::optional<mountain_range> mountain_range::restore(
    const uint64_t leaf_count,
    std::vector<cairn::schema::peak_t> peaks) {
  if (!is_well_formed(leaf_count, peaks)) {
    return std::nullopt;
  }
  auto range = mountain_range{};
  range.peaks_ = std::move(peaks);
  range.leaf_count_ = leaf_count;
  return range;
}

bool mountain_range::is_well_formed(
    const uint64_t leaf_count,
    const std::vector<cairn::schema::peak_t>& peaks) {
  if (peaks.size() != static_cast<size_t>(std::popcount(leaf_count))) {
    return false;
  }
  // Walk the set bits of leaf_count from the most significant down; each one
  // must match the next peak height.
  auto remaining = leaf_count;
  for (const auto& peak : peaks) {
    if (remaining == 0) {
      return false;
    }
    auto expected = static_cast<uint8_t>(std::bit_width(remaining) - 1);
    if (peak.height != expected) {
      return false;
    }
    remaining &= ~(uint64_t{1} << expected);
  }
  return remaining == 0;
}

}  // namespace cairn::mmr
