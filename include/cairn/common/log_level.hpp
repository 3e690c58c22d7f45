#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cairn::common {

/// spdlog level for a `--log-level` value, or nothing when the name is not
/// one spdlog knows. Accepts "off" explicitly.
inline std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace cairn::common
