#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "convintel/v1/patterns.pb.h"

namespace convintel::model {

enum class PatternType : std::uint8_t {
  kWho  = 1,
  kWhat = 2,
  kWhen = 3,
  kHow  = 4,
};

inline constexpr std::array<PatternType, 4> kAllPatternTypes = {
    PatternType::kWho, PatternType::kWhat, PatternType::kWhen, PatternType::kHow};

constexpr std::string_view ToString(PatternType type) {
  switch (type) {
    case PatternType::kWho:
      return "who";
    case PatternType::kWhat:
      return "what";
    case PatternType::kWhen:
      return "when";
    case PatternType::kHow:
      return "how";
  }
  return "unknown";
}

// Accepts "who"/"WHO" and the proto enum names ("PATTERN_TYPE_WHO").
std::optional<PatternType> ParsePatternType(std::string_view text);

convintel::v1::PatternType ToProto(PatternType type);

// Throws util::InvalidArgument for PATTERN_TYPE_UNSPECIFIED.
PatternType FromProto(convintel::v1::PatternType type);

} // namespace convintel::model
