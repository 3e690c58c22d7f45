#pragma once
#include <cairn/schema/primitives.hpp>

// Schema type: push.
// Appends one opaque payload as the next leaf of an accumulator.
namespace cairn::schema {

template <uint16_t Version>
struct push;

template <>
struct push<1> final {
  uint16_t version{1};
  address_t address{};
  bytes_t payload;
};

using push_t = push<1>;

}  // namespace cairn::schema
