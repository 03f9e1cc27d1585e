#pragma once

#include <string>
#include <vector>

#include "internal/db/model/lead_record.hpp"
#include "internal/model/lead.hpp"

namespace convintel::scoring {

/*
  ComponentScorer

  Rebuilds the four component scores from lead attributes. Used by
  backfill for leads scored before component snapshots were recorded;
  live scoring happens in the product and is written back through
  ScoreSnapshotWriter.

    data_quality  0-20   email, phone, linkedin, personal email
    authority     0-25   first seniority keyword in the title
    company_fit   0-25   industry, employee count, country
    timing        0-15   new role, hiring, funded
*/

class ComponentScorer {
 public:
  explicit ComponentScorer(std::vector<std::string> target_industries);

  model::ComponentScores Score(const db::model::LeadRecord& lead) const;

  // 0-100: components normalized per maximum and weighted, plus the risk
  // component (weight 1 - sum(weights)).
  double TotalScore(const db::model::LeadRecord& lead, const model::ComponentScores& components,
                    const model::ScoringWeights& weights) const;

  static double DataQuality(const db::model::LeadRecord& lead);
  static double Authority(const std::string& title);
  double        CompanyFit(const db::model::LeadRecord& lead) const;
  static double Timing(const db::model::LeadRecord& lead);
  static double Risk(const db::model::LeadRecord& lead);

 private:
  std::vector<std::string> target_industries_;
};

} // namespace convintel::scoring
