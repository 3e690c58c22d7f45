#pragma once
#include <cairn/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cairn::schema::encoding {

// The codec is chosen at build time by tag:
//   auto enc = encoder<scale_encoder_tag>{};
// Hot swapping codecs is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  cairn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cairn::schema::bytes_t& out);

  template <typename T>
  T decode(const cairn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cairn::schema::bytes_view_t& bytes);
};

}  // namespace cairn::schema::encoding
