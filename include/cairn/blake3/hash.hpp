#pragma once
#include <blake3.h>
#include <cairn/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace cairn::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const cairn::schema::bytes_view_t& bytes);
  hasher& update(uint8_t byte);

  /// Digest of everything written so far. The hasher stays usable.
  cairn::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

cairn::schema::hash32_t hash(const std::string_view& str);
cairn::schema::hash32_t hash(const cairn::schema::bytes_view_t& bytes);

}  // namespace cairn::blake3
