#include <cairn/schema/key/engine_keys.hpp>

#include <algorithm>
#include <boost/endian/buffers.hpp>
#include <iterator>

namespace cairn::schema::key {

namespace {

void append_big_endian(cairn::schema::bytes_t& out, const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  out.insert(std::end(out), buffer.data(), buffer.data() + sizeof(buffer));
}

uint64_t read_big_endian(const cairn::schema::bytes_view_t& bytes,
                         const size_t offset) {
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy_n(std::begin(bytes) + static_cast<std::ptrdiff_t>(offset),
              sizeof(buffer), buffer.data());
  return buffer.value();
}

bool has_prefix(const cairn::schema::bytes_view_t& key,
                const std::string_view prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

std::optional<std::pair<uint64_t, uint64_t>> parse_pair_key(
    const cairn::schema::bytes_view_t& key,
    const std::string_view prefix) {
  if (!has_prefix(key, prefix) ||
      key.size() != prefix.size() + 2 * sizeof(uint64_t)) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint64_t>{
      read_big_endian(key, prefix.size()),
      read_big_endian(key, prefix.size() + sizeof(uint64_t))};
}

}  // namespace

cairn::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const cairn::schema::bytes_t& id) {
  auto key = cairn::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

cairn::schema::bytes_t make_accumulator_key(
    const cairn::schema::address_t address) {
  auto key = cairn::schema::make_bytes(kAccumulatorKeyPrefix);
  append_big_endian(key, address);
  return key;
}

cairn::schema::bytes_t make_leaf_prefix_key(
    const cairn::schema::address_t address) {
  auto key = cairn::schema::make_bytes(kLeafKeyPrefix);
  append_big_endian(key, address);
  return key;
}

cairn::schema::bytes_t make_leaf_key(const cairn::schema::address_t address,
                                     const uint64_t index) {
  auto key = make_leaf_prefix_key(address);
  append_big_endian(key, index);
  return key;
}

cairn::schema::bytes_t make_checkpoint_prefix_key(
    const cairn::schema::address_t address) {
  auto key = cairn::schema::make_bytes(kCheckpointKeyPrefix);
  append_big_endian(key, address);
  return key;
}

cairn::schema::bytes_t make_checkpoint_key(
    const cairn::schema::address_t address,
    const uint64_t height) {
  auto key = make_checkpoint_prefix_key(address);
  append_big_endian(key, height);
  return key;
}

std::optional<cairn::schema::address_t> parse_accumulator_key(
    const cairn::schema::bytes_view_t& key) {
  if (!has_prefix(key, kAccumulatorKeyPrefix) ||
      key.size() != kAccumulatorKeyPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  return read_big_endian(key, kAccumulatorKeyPrefix.size());
}

std::optional<std::pair<cairn::schema::address_t, uint64_t>> parse_leaf_key(
    const cairn::schema::bytes_view_t& key) {
  return parse_pair_key(key, kLeafKeyPrefix);
}

std::optional<std::pair<cairn::schema::address_t, uint64_t>>
parse_checkpoint_key(const cairn::schema::bytes_view_t& key) {
  return parse_pair_key(key, kCheckpointKeyPrefix);
}

}  // namespace cairn::schema::key
