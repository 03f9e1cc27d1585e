#include "lead_features.hpp"

#include <cctype>
#include <utility>
#include <vector>

#include "content_features.hpp"

namespace convintel::features {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string TitleCase(std::string_view lowered) {
  std::string out(lowered);
  bool        start = true;
  for (auto& ch : out) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalpha(c)) {
      ch    = static_cast<char>(start ? std::toupper(c) : std::tolower(c));
      start = false;
    } else {
      start = true;
    }
  }
  return out;
}

// Whole-word match; "director" must not match "cto".
bool ContainsWord(std::string_view text, std::string_view word) {
  std::size_t pos = text.find(word);
  while (pos != std::string_view::npos) {
    const bool left  = pos == 0 || !std::isalpha(static_cast<unsigned char>(text[pos - 1]));
    const auto end   = pos + word.size();
    const bool right = end == text.size() || !std::isalpha(static_cast<unsigned char>(text[end]));
    if (left && right) return true;
    pos = text.find(word, pos + 1);
  }
  return false;
}

} // namespace

std::optional<std::string> NormalizeTitle(std::string_view title) {
  const auto trimmed = Trim(title);
  if (trimmed.empty()) return std::nullopt;

  static const std::vector<std::pair<std::string, std::vector<std::string>>> kMappings = {
      {"ceo", {"chief executive", "chief exec", "c.e.o"}},
      {"cmo", {"chief marketing", "chief mktg", "vp marketing", "vp of marketing"}},
      {"cfo", {"chief financial", "chief finance"}},
      {"coo", {"chief operating", "chief ops"}},
      {"cto", {"chief technology", "chief tech"}},
      {"owner", {"founder", "co-founder", "cofounder", "principal"}},
      {"marketing director", {"director of marketing", "director marketing"}},
      {"sales director", {"director of sales", "director sales"}},
  };

  const auto lowered = ToLower(trimmed);
  for (const auto& [canonical, variations] : kMappings) {
    for (const auto& v : variations) {
      if (lowered.find(v) != std::string::npos) return canonical;
    }
    if (ContainsWord(lowered, canonical)) return canonical;
  }
  return TitleCase(lowered);
}

std::optional<std::size_t> SizeBucketIndex(uint32_t employee_count) {
  if (employee_count == 0) return std::nullopt;
  for (std::size_t i = 0; i < kSizeBuckets.size(); ++i) {
    if (employee_count >= kSizeBuckets[i].min && employee_count <= kSizeBuckets[i].max) return i;
  }
  return std::nullopt;
}

} // namespace convintel::features
