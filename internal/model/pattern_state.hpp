#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace convintel::model {

/*
  Lifecycle of the current pattern row for one (tenant, type):

    absent -> valid -> expiring-soon -> expired -> (recomputed) valid

  The state is derived from valid_until; nothing stores it.
*/

enum class PatternState : std::uint8_t {
  kAbsent       = 0,
  kValid        = 1,
  kExpiringSoon = 2,
  kExpired      = 3,
};

constexpr PatternState Classify(std::optional<std::uint64_t> valid_until_ms, std::uint64_t now_ms,
                                std::uint64_t expiring_window_ms) {
  if (!valid_until_ms) return PatternState::kAbsent;
  if (*valid_until_ms <= now_ms) return PatternState::kExpired;
  if (*valid_until_ms - now_ms <= expiring_window_ms) return PatternState::kExpiringSoon;
  return PatternState::kValid;
}

constexpr bool IsUsable(PatternState state) {
  return state == PatternState::kValid || state == PatternState::kExpiringSoon;
}

constexpr std::string_view ToString(PatternState state) {
  switch (state) {
    case PatternState::kAbsent:
      return "absent";
    case PatternState::kValid:
      return "valid";
    case PatternState::kExpiringSoon:
      return "expiring_soon";
    case PatternState::kExpired:
      return "expired";
  }
  return "absent";
}

} // namespace convintel::model
