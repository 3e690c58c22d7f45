#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: query height.
// Which accumulator state a read observes: the latest committed block, the
// block being finalized, or an explicit block height.
namespace cairn::schema {

enum class query_height_kind_t : uint8_t {
  committed = 0,
  pending = 1,
  explicit_height = 2
};

struct query_height_t final {
  query_height_kind_t kind{query_height_kind_t::committed};
  uint64_t height{};

  static constexpr query_height_t committed() { return {}; }
  static constexpr query_height_t pending() {
    return {.kind = query_height_kind_t::pending, .height = 0};
  }
  static constexpr query_height_t at(const uint64_t height) {
    return {.kind = query_height_kind_t::explicit_height, .height = height};
  }

  bool operator==(const query_height_t&) const = default;
};

/// Parse "committed", "pending" or a decimal block height.
inline std::optional<query_height_t> try_parse_query_height(
    const std::string_view value) {
  if (value == "committed") {
    return query_height_t::committed();
  }
  if (value == "pending") {
    return query_height_t::pending();
  }
  auto height = uint64_t{};
  auto [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), height);
  if (value.empty() || error != std::errc{} ||
      end != value.data() + value.size()) {
    return std::nullopt;
  }
  return query_height_t::at(height);
}

}  // namespace cairn::schema
