#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace convintel::features {

/*
  Content feature extractors.

  Pure functions over raw message text. Matching is case-insensitive
  substring matching against fixed vocabularies; results are returned in
  vocabulary order so snapshots are reproducible.
*/

// leads, revenue, time, scaling, competition, cost, quality, clients
std::vector<std::string> ExtractPainPoints(std::string_view text);

// First phrase of the CTA list found in the text; empty when none.
std::string ExtractCta(std::string_view text);

struct PersonalizationContext {
  std::string first_name;
  std::string company;
  std::string industry;
};

struct PersonalizationFlags {
  bool has_company_mention   = false;
  bool has_first_name        = false;
  bool has_recent_news       = false;
  bool has_mutual_connection = false;
  bool has_industry_specific = false;
};

PersonalizationFlags ExtractPersonalization(std::string_view text, const PersonalizationContext& lead);

// roi_focused, social_proof, curiosity, fear_based, value_add, authority
std::vector<std::string> ExtractAngles(std::string_view text);

// question_about, quick_question, reply_style, idea_for, thought_about,
// personalized, or "other". Empty subject gives an empty string.
std::string ClassifySubject(std::string_view subject);

uint32_t CountWords(std::string_view text);
uint32_t CountLinks(std::string_view text);

// 160 characters per SMS segment; 0 for an empty message.
uint32_t SmsSegments(std::string_view text);

std::string ToLower(std::string_view text);

} // namespace convintel::features
