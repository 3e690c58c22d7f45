#pragma once

#include <cairn/schema/primitives.hpp>
#include <cairn/schema/write_access.hpp>

namespace cairn::mmr {

/// Write gate checked before every append. `only_owner` admits exactly the
/// owner identity, `public_write` admits any caller.
bool can_write(const cairn::schema::signer_id_t& caller,
               cairn::schema::write_access_t policy,
               const cairn::schema::signer_id_t& owner);

}  // namespace cairn::mmr
