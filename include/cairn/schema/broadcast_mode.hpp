#pragma once

#include <cairn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: broadcast mode.
// How long a submitted transaction blocks the caller. Selects the CometBFT
// broadcast RPC; the on-ledger effect is the same for every mode.
namespace cairn::schema {

enum class broadcast_mode_t : uint8_t { async = 0, sync = 1, commit = 2 };

inline constexpr auto kBroadcastModeMappings = std::array{
    std::pair<std::string_view, broadcast_mode_t>{"async",
                                                  broadcast_mode_t::async},
    std::pair<std::string_view, broadcast_mode_t>{"sync",
                                                  broadcast_mode_t::sync},
    std::pair<std::string_view, broadcast_mode_t>{"commit",
                                                  broadcast_mode_t::commit}};

template <>
inline std::optional<broadcast_mode_t> try_from_string<broadcast_mode_t>(
    const std::string_view value) {
  return from_string(value, kBroadcastModeMappings);
}

inline constexpr std::string_view to_string(const broadcast_mode_t value) {
  return to_string(value, kBroadcastModeMappings).value_or("unknown");
}

inline constexpr std::string_view rpc_method(const broadcast_mode_t value) {
  switch (value) {
    case broadcast_mode_t::async:
      return "broadcast_tx_async";
    case broadcast_mode_t::sync:
      return "broadcast_tx_sync";
    case broadcast_mode_t::commit:
    default:
      return "broadcast_tx_commit";
  }
}

}  // namespace cairn::schema
