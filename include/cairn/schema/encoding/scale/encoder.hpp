#pragma once
#include <cairn/common/critical.hpp>
#include <cairn/schema/encoding/encoder.hpp>
#include <cairn/schema/encoding/scale/accumulator_state.hpp>
#include <cairn/schema/encoding/scale/checkpoint.hpp>
#include <cairn/schema/encoding/scale/create_accumulator.hpp>
#include <cairn/schema/encoding/scale/leaf_record.hpp>
#include <cairn/schema/encoding/scale/peak.hpp>
#include <cairn/schema/encoding/scale/push.hpp>
#include <cairn/schema/encoding/scale/push_result.hpp>
#include <cairn/schema/encoding/scale/transaction.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace cairn::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  cairn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cairn::schema::bytes_t& out);

  template <typename T>
  T decode(const cairn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cairn::schema::bytes_view_t& bytes);
};

template <typename T>
cairn::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    cairn::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        cairn::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const cairn::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    cairn::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const cairn::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace cairn::schema::encoding
