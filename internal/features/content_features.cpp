#include "content_features.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>

namespace convintel::features {

namespace {

using Vocabulary = std::pair<std::string_view, std::vector<std::string_view>>;

const std::vector<Vocabulary>& PainPointVocabulary() {
  static const std::vector<Vocabulary> kVocabulary = {
      {"leads", {"leads", "pipeline", "prospects", "opportunities", "qualified", "mql", "sql", "inbound", "lead gen"}},
      {"revenue", {"revenue", "sales", "growth", "roi", "profit", "income", "deals", "closed", "won", "booking"}},
      {"time", {"time", "hours", "manual", "automate", "efficiency", "busy", "bandwidth", "overwhelmed", "tedious", "repetitive"}},
      {"scaling", {"scale", "scaling", "growth", "capacity", "bandwidth", "hire", "team", "expand", "growing", "bottleneck"}},
      {"competition", {"competitors", "competition", "market share", "behind", "catching up", "losing", "threat", "outpace"}},
      {"cost", {"cost", "expensive", "budget", "waste", "spending", "save", "afford", "price", "investment", "roi"}},
      {"quality", {"quality", "results", "performance", "outcomes", "better", "improve", "consistent", "reliable"}},
      {"clients", {"clients", "customers", "retention", "churn", "satisfaction", "referrals", "testimonials", "reviews"}},
  };
  return kVocabulary;
}

const std::vector<Vocabulary>& AngleVocabulary() {
  static const std::vector<Vocabulary> kVocabulary = {
      {"roi_focused", {"roi", "return", "revenue", "profit", "save", "increase", "boost"}},
      {"social_proof", {"clients like", "companies like", "case study", "helped", "worked with"}},
      {"curiosity", {"noticed", "wondering", "quick question", "curious", "saw that"}},
      {"fear_based", {"missing out", "losing", "behind", "risk", "problem", "struggle"}},
      {"value_add", {"free", "complimentary", "audit", "analysis", "no cost"}},
      {"authority", {"expert", "specialist", "experience", "trusted", "leading"}},
  };
  return kVocabulary;
}

constexpr std::array<std::string_view, 17> kCtaPhrases = {
    "open to a quick chat", "worth 15 minutes",  "worth a conversation", "free audit",    "free analysis",
    "quick call",           "schedule a call",   "book a time",          "interested in learning",
    "happy to share",       "let me know",       "thoughts?",            "make sense to connect",
    "grab 15 minutes",      "coffee chat",       "worth exploring",      "quick question",
};

constexpr std::array<std::string_view, 5> kMutualConnectionWords = {"mutual", "connection", "referred", "introduced", "recommended"};

bool ContainsAny(std::string_view haystack, const std::vector<std::string_view>& needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) { return haystack.find(n) != std::string_view::npos; });
}

std::vector<std::string> MatchVocabulary(std::string_view text, const std::vector<Vocabulary>& vocabulary) {
  std::vector<std::string> found;
  if (text.empty()) return found;
  const auto lowered = ToLower(text);
  for (const auto& [name, keywords] : vocabulary) {
    if (ContainsAny(lowered, keywords)) found.emplace_back(name);
  }
  return found;
}

bool MentionsField(const std::string& lowered_text, const std::string& field) {
  if (field.empty()) return false;
  return lowered_text.find(ToLower(field)) != std::string::npos;
}

} // namespace

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> ExtractPainPoints(std::string_view text) {
  return MatchVocabulary(text, PainPointVocabulary());
}

std::vector<std::string> ExtractAngles(std::string_view text) {
  return MatchVocabulary(text, AngleVocabulary());
}

std::string ExtractCta(std::string_view text) {
  if (text.empty()) return {};
  const auto lowered = ToLower(text);
  for (const auto phrase : kCtaPhrases) {
    if (lowered.find(phrase) != std::string::npos) return std::string(phrase);
  }
  return {};
}

PersonalizationFlags ExtractPersonalization(std::string_view text, const PersonalizationContext& lead) {
  PersonalizationFlags flags;
  if (text.empty()) return flags;

  static const std::regex kRecentNews("(noticed|saw|congrats|congratulations|just saw|read about|heard about)");

  const auto lowered          = ToLower(text);
  flags.has_company_mention   = MentionsField(lowered, lead.company);
  flags.has_first_name        = MentionsField(lowered, lead.first_name);
  flags.has_industry_specific = MentionsField(lowered, lead.industry);
  flags.has_recent_news       = std::regex_search(lowered, kRecentNews);
  flags.has_mutual_connection = std::any_of(kMutualConnectionWords.begin(), kMutualConnectionWords.end(),
                                            [&](std::string_view w) { return lowered.find(w) != std::string::npos; });
  return flags;
}

std::string ClassifySubject(std::string_view subject) {
  if (subject.empty()) return {};

  static const std::vector<std::pair<std::regex, std::string>> kPatterns = {
      {std::regex("question.*(about|for|regarding)"), "question_about"},
      {std::regex("^quick\\s+question"), "quick_question"},
      {std::regex("^re:"), "reply_style"},
      {std::regex("idea\\s+for"), "idea_for"},
      {std::regex("thought\\s+(about|for)"), "thought_about"},
      {std::regex("\\{company\\}|\\{first_name\\}"), "personalized"},
  };

  const auto lowered = ToLower(subject);
  for (const auto& [pattern, name] : kPatterns) {
    if (std::regex_search(lowered, pattern)) return name;
  }
  return "other";
}

uint32_t CountWords(std::string_view text) {
  uint32_t count   = 0;
  bool     in_word = false;
  for (const unsigned char c : text) {
    if (std::isspace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

uint32_t CountLinks(std::string_view text) {
  const auto lowered = ToLower(text);
  uint32_t   count   = 0;
  for (std::size_t pos = lowered.find("http"); pos != std::string::npos; pos = lowered.find("http", pos + 4)) {
    const auto rest = std::string_view(lowered).substr(pos);
    if (rest.starts_with("http://") || rest.starts_with("https://")) ++count;
  }
  return count;
}

uint32_t SmsSegments(std::string_view text) {
  if (text.empty()) return 0;
  return static_cast<uint32_t>(text.size() / 160 + 1);
}

} // namespace convintel::features
