#pragma once

#include <cairn/mmr/accumulator.hpp>
#include <cairn/schema/accumulator_state.hpp>
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/write_access.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace cairn::mmr {

/// Arena of accumulator instances keyed by sequential address.
///
/// Addresses start at 1 and are never reused. Instances are never removed,
/// so pointers returned by `attach` stay valid for the registry's lifetime.
class registry final {
 public:
  /// Allocate a fresh, empty accumulator.
  cairn::schema::address_t create(cairn::schema::write_access_t write_access,
                                  const cairn::schema::signer_id_t& owner,
                                  uint64_t height);

  /// Instance at `address`, or null when none was created there.
  accumulator* attach(cairn::schema::address_t address);
  const accumulator* attach(cairn::schema::address_t address) const;

  /// Reinsert a persisted accumulator. States must arrive in address order
  /// without gaps; returns null otherwise.
  accumulator* adopt(cairn::schema::accumulator_state_t state);

  cairn::schema::address_t next_address() const;
  size_t size() const;

 private:
  std::deque<accumulator> arena_;
};

}  // namespace cairn::mmr
