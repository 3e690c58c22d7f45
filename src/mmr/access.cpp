#include <cairn/mmr/access.hpp>

namespace cairn::mmr {

bool can_write(const cairn::schema::signer_id_t& caller,
               const cairn::schema::write_access_t policy,
               const cairn::schema::signer_id_t& owner) {
  switch (policy) {
    case cairn::schema::write_access_t::public_write:
      return true;
    case cairn::schema::write_access_t::only_owner:
      return caller == owner;
  }
  return false;
}

}  // namespace cairn::mmr
