#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace convintel::features {

// Canonical title group (ceo, cmo, cfo, coo, cto, owner, marketing director,
// sales director), otherwise the title in title case. nullopt for blank input.
std::optional<std::string> NormalizeTitle(std::string_view title);

struct SizeRange {
  std::string_view label;
  uint32_t         min;
  uint32_t         max;
};

inline constexpr std::array<SizeRange, 8> kSizeBuckets = {{
    {"1-5", 1, 5},
    {"6-15", 6, 15},
    {"16-30", 16, 30},
    {"31-50", 31, 50},
    {"51-100", 51, 100},
    {"101-250", 101, 250},
    {"251-500", 251, 500},
    {"501+", 501, UINT32_MAX},
}};

// Index into kSizeBuckets; nullopt when the employee count is unknown (0).
std::optional<std::size_t> SizeBucketIndex(uint32_t employee_count);

} // namespace convintel::features
