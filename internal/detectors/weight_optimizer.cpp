#include "weight_optimizer.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <numeric>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace convintel::detectors {

namespace {

constexpr Eigen::Index kWeights = static_cast<Eigen::Index>(model::kComponentCount);
constexpr Eigen::Index kBias    = kWeights;
constexpr Eigen::Index kVars    = kWeights + 1;

constexpr double kArmijo        = 1e-4;
constexpr int    kMaxBacktracks = 60;

using Vector = Eigen::Matrix<double, kVars, 1>;
using Matrix = Eigen::Matrix<double, kVars, kVars>;

// Bound state of one weight.
enum class Bound { kFree, kLower, kUpper };

double Softplus(double v) {
  return std::max(v, 0.0) + std::log1p(std::exp(-std::abs(v)));
}

double Logistic(double v) {
  return 1.0 / (1.0 + std::exp(-v));
}

class Problem {
 public:
  Problem(const std::vector<TrainingRow>& rows, double scale, double lambda) : rows_(rows), scale_(scale), lambda_(lambda) {
  }

  double Margin(const Vector& z, const TrainingRow& row) const {
    double dot = 0.0;
    for (Eigen::Index j = 0; j < kWeights; ++j) {
      dot += z(j) * row.features[static_cast<std::size_t>(j)];
    }
    return z(kBias) + scale_ * dot;
  }

  double Objective(const Vector& z) const {
    double loss = 0.0;
    for (const auto& row : rows_) {
      const double m = Margin(z, row);
      loss += Softplus(m) - (row.converted ? m : 0.0);
    }
    loss /= static_cast<double>(rows_.size());
    return loss + lambda_ * z.head<kWeights>().squaredNorm();
  }

  void Derivatives(const Vector& z, Vector& grad, Matrix& hess) const {
    grad.setZero();
    hess.setZero();

    Vector u;
    for (const auto& row : rows_) {
      for (Eigen::Index j = 0; j < kWeights; ++j) {
        u(j) = scale_ * row.features[static_cast<std::size_t>(j)];
      }
      u(kBias) = 1.0;

      const double p = Logistic(Margin(z, row));
      grad += (p - (row.converted ? 1.0 : 0.0)) * u;
      hess += (p * (1.0 - p)) * (u * u.transpose());
    }

    const double n = static_cast<double>(rows_.size());
    grad /= n;
    hess /= n;

    for (Eigen::Index j = 0; j < kWeights; ++j) {
      grad(j) += 2.0 * lambda_ * z(j);
      hess(j, j) += 2.0 * lambda_;
    }
  }

 private:
  const std::vector<TrainingRow>& rows_;
  double                          scale_;
  double                          lambda_;
};

bool IsFeasible(const std::array<double, model::kComponentCount>& w) {
  double sum = 0.0;
  for (double v : w) {
    if (!std::isfinite(v)) return false;
    if (v < model::kWeightLowerBound - 1e-9 || v > model::kWeightUpperBound + 1e-9) return false;
    sum += v;
  }
  return std::abs(sum - model::kWeightTarget) <= 1e-6;
}

OptimizerResult Fallback(std::string status) {
  OptimizerResult result;
  result.weights = model::DefaultWeights();
  result.status  = std::move(status);
  return result;
}

} // namespace

TrainingRow MakeTrainingRow(const model::ComponentScores& components, bool converted) {
  TrainingRow row;
  const auto  values = components.AsArray();
  for (std::size_t j = 0; j < model::kComponentCount; ++j) {
    row.features[j] = std::clamp(values[j] / model::kComponentMaxima[j], 0.0, 1.0);
  }
  row.converted = converted;
  return row;
}

WeightOptimizer::WeightOptimizer(config::OptimizerSettings settings) : settings_(settings) {
}

OptimizerResult WeightOptimizer::Solve(const std::vector<TrainingRow>& rows) const {
  const auto positives = std::count_if(rows.begin(), rows.end(), [](const TrainingRow& row) { return row.converted; });
  if (rows.empty() || positives == 0 || static_cast<std::size_t>(positives) == rows.size()) {
    throw util::OptimizerNonConvergence("degenerate training set");
  }

  const Problem problem(rows, settings_.score_scale, settings_.l2_lambda);
  const double  tol = settings_.tolerance;

  const auto defaults = model::DefaultWeights().AsArray();
  Vector     z;
  for (Eigen::Index j = 0; j < kWeights; ++j) {
    z(j) = defaults[static_cast<std::size_t>(j)];
  }
  const double base_rate = static_cast<double>(positives) / static_cast<double>(rows.size());
  z(kBias)               = std::log(base_rate / (1.0 - base_rate));

  std::array<Bound, model::kComponentCount> bounds{};
  bounds.fill(Bound::kFree);

  Vector grad;
  Matrix hess;

  for (uint32_t iter = 0; iter < settings_.max_iterations; ++iter) {
    problem.Derivatives(z, grad, hess);

    std::vector<Eigen::Index> free;
    for (Eigen::Index j = 0; j < kWeights; ++j) {
      if (bounds[static_cast<std::size_t>(j)] == Bound::kFree) free.push_back(j);
    }
    const auto free_weights = static_cast<Eigen::Index>(free.size());
    free.push_back(kBias);

    const auto      nf  = static_cast<Eigen::Index>(free.size());
    const auto      dim = nf + (free_weights > 0 ? 1 : 0);
    Eigen::MatrixXd kkt = Eigen::MatrixXd::Zero(dim, dim);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(dim);

    for (Eigen::Index r = 0; r < nf; ++r) {
      for (Eigen::Index c = 0; c < nf; ++c) {
        kkt(r, c) = hess(free[r], free[c]);
      }
      rhs(r) = -grad(free[r]);
    }
    // sum(w) is linear, so a step with a.d = 0 keeps it at the target
    for (Eigen::Index r = 0; r < free_weights; ++r) {
      kkt(r, nf) = 1.0;
      kkt(nf, r) = 1.0;
    }

    Eigen::FullPivLU<Eigen::MatrixXd> lu(kkt);
    if (!lu.isInvertible()) {
      throw util::OptimizerNonConvergence("singular KKT system");
    }
    const Eigen::VectorXd solution = lu.solve(rhs);

    Vector step = Vector::Zero();
    for (Eigen::Index r = 0; r < nf; ++r) {
      step(free[r]) = solution(r);
    }
    const double nu = free_weights > 0 ? solution(nf) : 0.0;

    if (!step.allFinite()) {
      throw util::OptimizerNonConvergence("non-finite Newton step");
    }

    // Stationary on the working set once the step is lost in rounding
    // relative to the iterate, or the accepted step no longer lowers the
    // objective by more than tol relative to its magnitude.
    bool stationary = step.lpNorm<Eigen::Infinity>() < tol * (1.0 + z.lpNorm<Eigen::Infinity>());

    if (!stationary) {
      // ratio test against the bounds of the free weights
      double       max_alpha = 1.0;
      Eigen::Index blocking  = -1;
      Bound        side      = Bound::kFree;
      for (Eigen::Index j = 0; j < kWeights; ++j) {
        if (bounds[static_cast<std::size_t>(j)] != Bound::kFree) continue;
        if (step(j) < 0.0) {
          const double alpha = (model::kWeightLowerBound - z(j)) / step(j);
          if (alpha < max_alpha) {
            max_alpha = alpha;
            blocking  = j;
            side      = Bound::kLower;
          }
        } else if (step(j) > 0.0) {
          const double alpha = (model::kWeightUpperBound - z(j)) / step(j);
          if (alpha < max_alpha) {
            max_alpha = alpha;
            blocking  = j;
            side      = Bound::kUpper;
          }
        }
      }
      max_alpha = std::max(max_alpha, 0.0);

      const double f0      = problem.Objective(z);
      const double slope   = grad.dot(step);
      const double f_noise = tol * (1.0 + std::abs(f0));

      double alpha    = max_alpha;
      double f_next   = f0;
      bool   accepted = false;
      Vector next     = z;
      for (int ls = 0; ls < kMaxBacktracks; ++ls) {
        next   = z + alpha * step;
        f_next = problem.Objective(next);
        if (f_next <= f0 + kArmijo * alpha * slope) {
          accepted = true;
          break;
        }
        alpha *= 0.5;
      }

      const bool hits_bound = accepted && blocking >= 0 && alpha == max_alpha;
      if (!accepted) {
        // no descent left to find: the predicted decrease is below rounding
        if (-slope > f_noise) {
          throw util::OptimizerNonConvergence("line search failed");
        }
        stationary = true;
      } else {
        if (hits_bound) {
          next(blocking) = side == Bound::kLower ? model::kWeightLowerBound : model::kWeightUpperBound;
          bounds[static_cast<std::size_t>(blocking)] = side;
        }
        z          = next;
        stationary = !hits_bound && f0 - f_next <= f_noise;
      }
    }

    if (!stationary) continue;

    // release the bound with the most negative multiplier, or stop
    int    release = -1;
    double worst   = tol;
    for (Eigen::Index j = 0; j < kWeights; ++j) {
      const auto bound = bounds[static_cast<std::size_t>(j)];
      if (bound == Bound::kFree) continue;
      const double reduced    = grad(j) + nu;
      const double multiplier = bound == Bound::kLower ? reduced : -reduced;
      if (-multiplier > worst) {
        worst   = -multiplier;
        release = static_cast<int>(j);
      }
    }
    if (release < 0) {
      OptimizerResult result;
      std::array<double, model::kComponentCount> w{};
      for (Eigen::Index j = 0; j < kWeights; ++j) {
        w[static_cast<std::size_t>(j)] = z(j);
      }
      result.weights    = model::ScoringWeights::FromArray(w);
      result.status     = "converged";
      result.iterations = iter + 1;
      result.objective  = problem.Objective(z);
      return result;
    }
    bounds[static_cast<std::size_t>(release)] = Bound::kFree;
  }

  throw util::OptimizerNonConvergence("iteration limit reached");
}

OptimizerResult WeightOptimizer::Optimize(const std::vector<TrainingRow>& rows) const {
  if (rows.size() < settings_.min_rows) {
    return Fallback("insufficient_rows");
  }

  const auto positives = std::count_if(rows.begin(), rows.end(), [](const TrainingRow& row) { return row.converted; });
  if (positives == 0 || static_cast<std::size_t>(positives) == rows.size()) {
    return Fallback("single_class");
  }

  try {
    auto result = Solve(rows);
    const auto raw = result.weights.AsArray();
    if (!IsFeasible(raw)) {
      CONVINTEL_LOG_WARN("Optimizer produced infeasible weights; using defaults",
                         {observability::IntField("rows", static_cast<std::int64_t>(rows.size()))});
      return Fallback("invalid_result");
    }
    result.weights = RoundWeights(raw);
    return result;
  } catch (const util::OptimizerNonConvergence& e) {
    CONVINTEL_LOG_WARN("Optimizer did not converge; using defaults",
                       {observability::StringField("error", e.what()),
                        observability::IntField("rows", static_cast<std::int64_t>(rows.size()))});
    return Fallback("non_convergence");
  }
}

model::ScoringWeights WeightOptimizer::RoundWeights(const std::array<double, model::kComponentCount>& weights) {
  constexpr long kLower  = 50;
  constexpr long kUpper  = 500;
  constexpr long kTarget = 850;

  std::array<long, model::kComponentCount> thousandths{};
  for (std::size_t j = 0; j < weights.size(); ++j) {
    thousandths[j] = std::clamp(std::lround(weights[j] * 1000.0), kLower, kUpper);
  }
  long residual = kTarget - std::accumulate(thousandths.begin(), thousandths.end(), 0L);

  std::array<std::size_t, model::kComponentCount> order{};
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return weights[a] > weights[b]; });

  for (std::size_t idx : order) {
    if (residual == 0) break;
    const long candidate = thousandths[idx] + residual;
    if (candidate >= kLower && candidate <= kUpper) {
      thousandths[idx] = candidate;
      residual         = 0;
    }
  }
  // residual larger than any single weight can absorb
  for (std::size_t idx : order) {
    while (residual != 0) {
      const long unit = residual > 0 ? 1 : -1;
      if (thousandths[idx] + unit < kLower || thousandths[idx] + unit > kUpper) break;
      thousandths[idx] += unit;
      residual -= unit;
    }
  }

  std::array<double, model::kComponentCount> rounded{};
  for (std::size_t j = 0; j < rounded.size(); ++j) {
    rounded[j] = static_cast<double>(thousandths[j]) / 1000.0;
  }
  return model::ScoringWeights::FromArray(rounded);
}

} // namespace convintel::detectors
