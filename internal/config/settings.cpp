#include "settings.hpp"

#include <stdexcept>

namespace convintel::config {

namespace {

void Require(bool condition, const std::string& what) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + what);
  }
}

template <typename T>
T OrDefault(T value, T fallback) {
  return value == T{} ? fallback : value;
}

} // namespace

std::vector<std::string> DefaultTargetIndustries() {
  return {"technology", "software",   "saas",        "fintech",      "marketing", "professional services",
          "consulting", "healthcare", "real estate", "construction", "manufacturing"};
}

Settings Resolve(const convintel::runtime::config::RuntimeConfig& config) {
  Settings settings;

  const auto& learning  = config.learning();
  const auto& optimizer = learning.optimizer();

  auto& opt          = settings.detectors.optimizer;
  opt.l2_lambda      = OrDefault(optimizer.l2_lambda(), opt.l2_lambda);
  opt.max_iterations = OrDefault(optimizer.max_iterations(), opt.max_iterations);
  opt.tolerance      = OrDefault(optimizer.tolerance(), opt.tolerance);
  opt.score_scale    = OrDefault(optimizer.score_scale(), opt.score_scale);
  opt.min_rows       = OrDefault(optimizer.min_rows(), opt.min_rows);
  Require(opt.l2_lambda >= 0.0, "learning.optimizer.l2_lambda must be >= 0");
  Require(opt.tolerance > 0.0, "learning.optimizer.tolerance must be > 0");
  Require(opt.score_scale > 0.0, "learning.optimizer.score_scale must be > 0");

  settings.detectors.non_converting_sample_cap = OrDefault(learning.non_converting_sample_cap(), settings.detectors.non_converting_sample_cap);
  if (learning.target_industries_size() > 0) {
    settings.detectors.target_industries.assign(learning.target_industries().begin(), learning.target_industries().end());
  } else {
    settings.detectors.target_industries = DefaultTargetIndustries();
  }

  auto& store           = settings.store;
  store.validity_days   = OrDefault(learning.validity_days(), store.validity_days);
  store.min_confidence  = OrDefault(learning.min_confidence_to_store(), store.min_confidence);
  store.min_sample_size = OrDefault(learning.min_sample_size_to_store(), store.min_sample_size);
  store.write_retries   = OrDefault(learning.store_write_retries(), store.write_retries);
  if (learning.store_retry_backoff_ms() > 0) {
    store.retry_backoff = std::chrono::milliseconds(learning.store_retry_backoff_ms());
  }
  Require(store.min_confidence >= 0.0 && store.min_confidence <= 1.0, "learning.min_confidence_to_store must be within [0,1]");

  auto& run           = settings.learning;
  run.lookback_days   = OrDefault(learning.lookback_days(), run.lookback_days);
  run.min_conversions = OrDefault(learning.min_conversions(), run.min_conversions);
  run.max_retries     = OrDefault(learning.max_retries(), run.max_retries);
  if (learning.retry_delay_ms() > 0) {
    run.retry_delay = std::chrono::milliseconds(learning.retry_delay_ms());
  }
  run.worker_threads  = OrDefault(learning.worker_threads(), run.worker_threads);
  run.archive_expired = !learning.keep_expired_patterns();

  const auto& health_cfg      = config.health();
  auto&       health          = settings.health;
  health.expiring_soon_days   = OrDefault(health_cfg.expiring_soon_days(), health.expiring_soon_days);
  health.min_sample_size      = OrDefault(health_cfg.min_sample_size(), health.min_sample_size);
  health.min_confidence       = OrDefault(health_cfg.min_confidence(), health.min_confidence);
  health.weight_sum_tolerance = OrDefault(health_cfg.weight_sum_tolerance(), health.weight_sum_tolerance);
  health.escalation_threshold = OrDefault(health_cfg.escalation_threshold(), health.escalation_threshold);
  Require(health.min_confidence >= 0.0 && health.min_confidence <= 1.0, "health.min_confidence must be within [0,1]");

  const auto& scheduler_cfg = config.scheduler();
  auto&       scheduler     = settings.scheduler;
  if (scheduler_cfg.learning_interval_hours() > 0) {
    scheduler.learning_interval = std::chrono::hours(scheduler_cfg.learning_interval_hours());
  }
  if (scheduler_cfg.health_interval_hours() > 0) {
    scheduler.health_interval = std::chrono::hours(scheduler_cfg.health_interval_hours());
  }
  scheduler.run_on_start = scheduler_cfg.run_on_start();

  return settings;
}

} // namespace convintel::config
