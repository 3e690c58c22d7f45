#pragma once

#include <cairn/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace cairn::testing {

inline cairn::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = cairn::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline cairn::schema::named_signer_t make_named_signer_id(const uint8_t seed) {
  auto named = cairn::schema::named_signer_t{};
  named[0] = seed;
  return named;
}

inline cairn::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return cairn::schema::signer_id_t{make_named_signer_id(seed)};
}

inline cairn::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = cairn::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline cairn::schema::bytes_t make_payload(const std::string_view text) {
  return cairn::schema::make_bytes(text);
}

inline cairn::schema::bytes_view_t as_view(const cairn::schema::bytes_t& bytes) {
  return cairn::schema::bytes_view_t{bytes.data(), bytes.size()};
}

inline std::string hex(const cairn::schema::hash32_t& hash) {
  return cairn::schema::to_hex(cairn::schema::bytes_view_t{hash});
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace cairn::testing
