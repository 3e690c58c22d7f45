#pragma once
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/write_access.hpp>

// Schema type: create accumulator.
// Allocates a new, empty accumulator owned by the transaction signer.
namespace cairn::schema {

template <uint16_t Version>
struct create_accumulator;

template <>
struct create_accumulator<1> final {
  uint16_t version{1};
  write_access_t write_access{write_access_t::only_owner};
};

using create_accumulator_t = create_accumulator<1>;

}  // namespace cairn::schema
