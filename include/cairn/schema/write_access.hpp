#pragma once

#include <cairn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: write access.
// Accumulator write policy, fixed when the accumulator is created.
namespace cairn::schema {

enum class write_access_t : uint8_t { only_owner = 0, public_write = 1 };

inline constexpr auto kWriteAccessMappings =
    std::array{std::pair<std::string_view, write_access_t>{
                   "only_owner", write_access_t::only_owner},
               std::pair<std::string_view, write_access_t>{
                   "public", write_access_t::public_write}};

template <>
inline std::optional<write_access_t> try_from_string<write_access_t>(
    const std::string_view value) {
  return from_string(value, kWriteAccessMappings);
}

inline constexpr std::string_view to_string(const write_access_t value) {
  return to_string(value, kWriteAccessMappings).value_or("unknown");
}

}  // namespace cairn::schema
