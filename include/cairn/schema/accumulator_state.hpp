#pragma once

#include <cairn/schema/primitives.hpp>
#include <cairn/schema/write_access.hpp>
#include <cstdint>

// Schema type: accumulator state.
// Immutable metadata of one accumulator machine.
namespace cairn::schema {

template <uint16_t Version>
struct accumulator_state;

template <>
struct accumulator_state<1> final {
  uint16_t version{1};
  address_t address{};
  write_access_t write_access{write_access_t::only_owner};
  signer_id_t owner{};
  uint64_t created_height{};
};

using accumulator_state_t = accumulator_state<1>;

}  // namespace cairn::schema
