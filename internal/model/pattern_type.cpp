#include "pattern_type.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "internal/util/errors.hpp"

namespace convintel::model {

std::optional<PatternType> ParsePatternType(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
  constexpr std::string_view kPrefix = "pattern_type_";
  if (lowered.starts_with(kPrefix)) {
    lowered.erase(0, kPrefix.size());
  }
  for (const auto type : kAllPatternTypes) {
    if (lowered == ToString(type)) return type;
  }
  return std::nullopt;
}

convintel::v1::PatternType ToProto(PatternType type) {
  switch (type) {
    case PatternType::kWho:
      return convintel::v1::PATTERN_TYPE_WHO;
    case PatternType::kWhat:
      return convintel::v1::PATTERN_TYPE_WHAT;
    case PatternType::kWhen:
      return convintel::v1::PATTERN_TYPE_WHEN;
    case PatternType::kHow:
      return convintel::v1::PATTERN_TYPE_HOW;
  }
  return convintel::v1::PATTERN_TYPE_UNSPECIFIED;
}

PatternType FromProto(convintel::v1::PatternType type) {
  switch (type) {
    case convintel::v1::PATTERN_TYPE_WHO:
      return PatternType::kWho;
    case convintel::v1::PATTERN_TYPE_WHAT:
      return PatternType::kWhat;
    case convintel::v1::PATTERN_TYPE_WHEN:
      return PatternType::kWhen;
    case convintel::v1::PATTERN_TYPE_HOW:
      return PatternType::kHow;
    default:
      throw util::InvalidArgument("pattern type unspecified");
  }
}

} // namespace convintel::model
