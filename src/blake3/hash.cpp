#include <cairn/blake3/hash.hpp>

namespace cairn::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const cairn::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const uint8_t byte) {
  blake3_hasher_update(&state_, &byte, 1);
  return *this;
}

cairn::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == sizeof(cairn::schema::hash32_t));
  auto output = cairn::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

cairn::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

cairn::schema::hash32_t hash(const cairn::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace cairn::blake3
