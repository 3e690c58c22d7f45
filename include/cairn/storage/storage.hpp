#pragma once
#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace cairn::storage {

using key_value_entry_t =
    std::pair<cairn::schema::bytes_t, cairn::schema::bytes_t>;

/// Last committed block persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  cairn::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cairn::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cairn::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed block (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const cairn::schema::bytes_view_t& prefix) const;

  /// Atomically write encoded rows together with the committed block.
  void commit_block(const std::vector<key_value_entry_t>& rows,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cairn::storage
