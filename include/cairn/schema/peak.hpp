#pragma once

#include <cairn/schema/primitives.hpp>
#include <cstdint>

namespace cairn::schema {

/// Top commitment of one complete mountain; `height` counts merge levels.
struct peak_t final {
  uint8_t height{};
  hash32_t hash{};

  bool operator==(const peak_t&) const = default;
};

}  // namespace cairn::schema
