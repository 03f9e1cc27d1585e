#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/model/lead.hpp"

namespace convintel::detectors {

struct TrainingRow {
  std::array<double, model::kComponentCount> features{}; // component / maximum, in [0,1]
  bool                                       converted = false;
};

TrainingRow MakeTrainingRow(const model::ComponentScores& components, bool converted);

struct OptimizerResult {
  model::ScoringWeights weights;

  // converged | insufficient_rows | single_class | non_convergence | invalid_result
  std::string status;

  uint32_t iterations = 0;
  double   objective  = 0.0;

  bool Converged() const {
    return status == "converged";
  }
};

/*
  WeightOptimizer

  Fits scoring weights to terminal outcomes:

    p_i = sigmoid(b + k * w.x_i)
    minimize  mean cross-entropy(p, y) + lambda * |w|^2
    s.t.      0.05 <= w_j <= 0.50,  sum(w) = 0.85

  Deterministic active-set Newton: fixed start (default weights,
  b = logit(base rate)), equality-constrained Newton steps over the free
  weights, ratio test against the bounds, Armijo backtracking, and
  multiplier checks before releasing a bound.
*/
class WeightOptimizer {
 public:
  explicit WeightOptimizer(config::OptimizerSettings settings);

  // Never throws; falls back to the default weights with a warning.
  OptimizerResult Optimize(const std::vector<TrainingRow>& rows) const;

  // Unrounded solve. Throws util::OptimizerNonConvergence.
  OptimizerResult Solve(const std::vector<TrainingRow>& rows) const;

  // Thousandths summing to exactly 850; the residual goes to the largest
  // weight that stays within bounds.
  static model::ScoringWeights RoundWeights(const std::array<double, model::kComponentCount>& weights);

 private:
  config::OptimizerSettings settings_;
};

} // namespace convintel::detectors
