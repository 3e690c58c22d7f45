#pragma once

#include <cairn/schema/primitives.hpp>
#include <cstdint>

// Schema type: push result.
// Receipt of an applied push. The index is assigned by ledger order, so
// callers read it from here rather than predicting it.
namespace cairn::schema {

template <uint16_t Version>
struct push_result;

template <>
struct push_result<1> final {
  uint16_t version{1};
  address_t address{};
  uint64_t index{};
  hash32_t root{};
};

using push_result_t = push_result<1>;

}  // namespace cairn::schema
