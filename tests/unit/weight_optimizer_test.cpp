#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/detectors/weight_optimizer.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::detectors::MakeTrainingRow;
using convintel::detectors::TrainingRow;
using convintel::detectors::WeightOptimizer;

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) < eps;
}

// Authority decides the outcome; the other components carry little signal.
std::vector<TrainingRow> AuthorityDrivenRows(int count) {
  std::vector<TrainingRow> rows;
  for (int i = 0; i < count; ++i) {
    const int  d         = i % 10;
    const bool converted = (d >= 5) != (i % 17 == 0);

    convintel::model::ComponentScores components;
    components.data_quality = 20.0 * ((i * 7) % 10) / 9.0;
    components.authority    = 25.0 * d / 9.0;
    components.company_fit  = 25.0 * ((i * 3) % 10) / 9.0;
    components.timing       = 15.0 * ((i / 10) % 10) / 9.0;
    rows.push_back(MakeTrainingRow(components, converted));
  }
  return rows;
}

// Component levels the scorer actually emits: 60 converted, 140 failed.
std::vector<TrainingRow> ScorerLevelRows() {
  const double authority_levels[] = {25.0, 22.0, 18.0, 15.0, 10.0, 7.0, 5.0};
  std::vector<TrainingRow> rows;
  for (int i = 0; i < 200; ++i) {
    const bool converted = i < 60;

    convintel::model::ComponentScores components;
    components.data_quality = i % 3 == 0 ? 15.0 : (i % 3 == 1 ? 11.0 : 4.0);
    components.authority    = converted ? authority_levels[i % 3] : authority_levels[2 + i % 5];
    components.company_fit  = i % 4 == 0 ? 25.0 : (i % 4 == 1 ? 14.0 : 7.0);
    components.timing       = converted ? (i % 2 == 0 ? 11.0 : 5.0) : (i % 5 == 0 ? 6.0 : 0.0);
    rows.push_back(MakeTrainingRow(components, converted));
  }
  return rows;
}

void TestTrainingRowNormalizesByMaximum() {
  const auto row = MakeTrainingRow({.data_quality = 10.0, .authority = 25.0, .company_fit = 30.0, .timing = -1.0}, true);
  assert(Near(row.features[0], 0.5));
  assert(Near(row.features[1], 1.0));
  assert(Near(row.features[2], 1.0));
  assert(Near(row.features[3], 0.0));
  assert(row.converted);
}

void TestLearnsDominantComponent() {
  WeightOptimizer optimizer(convintel::config::OptimizerSettings{});
  const auto      result = optimizer.Optimize(AuthorityDrivenRows(300));

  assert(result.Converged());
  const auto w = result.weights.AsArray();
  for (double v : w) {
    assert(v >= convintel::model::kWeightLowerBound - 1e-12);
    assert(v <= convintel::model::kWeightUpperBound + 1e-12);
  }
  assert(Near(result.weights.Sum(), convintel::model::kWeightTarget, 1e-9));
  assert(result.weights.authority >= 0.4);
  assert(result.weights.authority >= *std::max_element(w.begin(), w.end()));
}

void TestStopsBeforeIterationLimitOnScorerLevels() {
  convintel::config::OptimizerSettings settings;
  WeightOptimizer                      optimizer(settings);
  const auto                           rows = ScorerLevelRows();

  // Solve throws on the iteration limit
  const auto solved = optimizer.Solve(rows);
  assert(solved.iterations < settings.max_iterations);

  const auto result = optimizer.Optimize(rows);
  assert(result.status == "converged");
  assert(!(result.weights == convintel::model::DefaultWeights()));
  assert(result.weights.authority > convintel::model::DefaultWeights().authority);
  assert(Near(result.weights.Sum(), convintel::model::kWeightTarget, 1e-9));
}

void TestDeterministicAcrossRuns() {
  WeightOptimizer optimizer(convintel::config::OptimizerSettings{});
  const auto      rows = AuthorityDrivenRows(120);
  assert(optimizer.Optimize(rows).weights == optimizer.Optimize(rows).weights);
}

void TestFallbacks() {
  WeightOptimizer optimizer(convintel::config::OptimizerSettings{});

  const auto few = optimizer.Optimize(AuthorityDrivenRows(10));
  assert(few.status == "insufficient_rows");
  assert(few.weights == convintel::model::DefaultWeights());

  auto rows = AuthorityDrivenRows(60);
  for (auto& row : rows) row.converted = false;
  const auto single = optimizer.Optimize(rows);
  assert(single.status == "single_class");
  assert(single.weights == convintel::model::DefaultWeights());

  bool threw = false;
  try {
    optimizer.Solve(rows);
  } catch (const convintel::util::OptimizerNonConvergence&) {
    threw = true;
  }
  assert(threw);
}

void TestIterationLimitFallsBackToDefaults() {
  convintel::config::OptimizerSettings settings;
  settings.max_iterations = 0;
  WeightOptimizer optimizer(settings);

  const auto result = optimizer.Optimize(AuthorityDrivenRows(100));
  assert(result.status == "non_convergence");
  assert(result.weights == convintel::model::DefaultWeights());
}

void TestRoundWeightsHitsTargetExactly() {
  const auto nudged = WeightOptimizer::RoundWeights({0.2004, 0.2504, 0.2504, 0.1494});
  assert(Near(nudged.data_quality, 0.200));
  assert(Near(nudged.authority, 0.251));
  assert(Near(nudged.company_fit, 0.250));
  assert(Near(nudged.timing, 0.149));

  const auto clamped = WeightOptimizer::RoundWeights({0.6, 0.6, 0.01, 0.01});
  assert(Near(clamped.data_quality, 0.25));
  assert(Near(clamped.authority, 0.50));
  assert(Near(clamped.company_fit, 0.05));
  assert(Near(clamped.timing, 0.05));
  assert(Near(clamped.Sum(), 0.85));
}

} // namespace

int main() {
  TestTrainingRowNormalizesByMaximum();
  TestLearnsDominantComponent();
  TestStopsBeforeIterationLimitOnScorerLevels();
  TestDeterministicAcrossRuns();
  TestFallbacks();
  TestIterationLimitFallsBackToDefaults();
  TestRoundWeightsHitsTargetExactly();

  std::cout << "convintel_unit_weight_optimizer: pass\n";
  return 0;
}
