#include <cairn/blake3/hash.hpp>
#include <cairn/mmr/hash.hpp>

#include <iterator>

namespace cairn::mmr {

cairn::schema::hash32_t hash_leaf(const cairn::schema::bytes_view_t& payload) {
  auto hasher = cairn::blake3::hasher{};
  hasher.update(kLeafDomainTag);
  hasher.update(payload);
  return hasher.finalize();
}

cairn::schema::hash32_t hash_node(const cairn::schema::hash32_t& left,
                                  const cairn::schema::hash32_t& right) {
  auto hasher = cairn::blake3::hasher{};
  hasher.update(kNodeDomainTag);
  hasher.update(cairn::schema::bytes_view_t{left});
  hasher.update(cairn::schema::bytes_view_t{right});
  return hasher.finalize();
}

cairn::schema::hash32_t bag_peaks(
    std::span<const cairn::schema::peak_t> peaks) {
  if (peaks.empty()) {
    return cairn::schema::make_zero_hash();
  }
  auto root = peaks.back().hash;
  for (auto it = std::next(std::rbegin(peaks)); it != std::rend(peaks); ++it) {
    root = hash_node(it->hash, root);
  }
  return root;
}

}  // namespace cairn::mmr
