#pragma once

#include <cairn/schema/primitives.hpp>
#include <cstdint>

// Schema type: leaf record.
// Stored leaf: payload bytes and the leaf commitment derived from them.
namespace cairn::schema {

template <uint16_t Version>
struct leaf_record;

template <>
struct leaf_record<1> final {
  uint16_t version{1};
  bytes_t payload;
  hash32_t commitment{};
};

using leaf_record_t = leaf_record<1>;

}  // namespace cairn::schema
