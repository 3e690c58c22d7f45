#include <cairn/mmr/registry.hpp>

#include <utility>

namespace cairn::mmr {

cairn::schema::address_t registry::create(
    const cairn::schema::write_access_t write_access,
    const cairn::schema::signer_id_t& owner,
    const uint64_t height) {
  auto address = next_address();
  arena_.emplace_back(cairn::schema::accumulator_state_t{
      .address = address,
      .write_access = write_access,
      .owner = owner,
      .created_height = height});
  return address;
}

accumulator* registry::attach(const cairn::schema::address_t address) {
  if (address == 0 || address > arena_.size()) {
    return nullptr;
  }
  return &arena_[address - 1];
}

const accumulator* registry::attach(
    const cairn::schema::address_t address) const {
  if (address == 0 || address > arena_.size()) {
    return nullptr;
  }
  return &arena_[address - 1];
}

accumulator* registry::adopt(cairn::schema::accumulator_state_t state) {
  if (state.address != next_address()) {
    return nullptr;
  }
  return &arena_.emplace_back(std::move(state));
}

cairn::schema::address_t registry::next_address() const {
  return static_cast<cairn::schema::address_t>(arena_.size()) + 1;
}

size_t registry::size() const {
  return arena_.size();
}

}  // namespace cairn::mmr
