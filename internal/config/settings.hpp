#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace convintel::config {

/*
  Resolved runtime settings.

  RuntimeConfig is proto3, so unset numeric fields read as zero. Resolve()
  substitutes the built-in defaults and validates ranges once at startup;
  everything downstream consumes these plain structs.
*/

struct OptimizerSettings {
  double   l2_lambda      = 0.01;
  uint32_t max_iterations = 100;
  double   tolerance      = 1e-8;
  double   score_scale    = 10.0;
  uint32_t min_rows       = 30;
};

struct DetectorSettings {
  uint32_t                 non_converting_sample_cap = 5000;
  OptimizerSettings        optimizer;
  std::vector<std::string> target_industries;
};

struct StoreSettings {
  uint32_t                  validity_days   = 14;
  double                    min_confidence  = 0.1;
  uint32_t                  min_sample_size = 30;
  uint32_t                  write_retries   = 3;
  std::chrono::milliseconds retry_backoff{50};
};

struct LearningSettings {
  uint32_t                  lookback_days   = 90;
  uint32_t                  min_conversions = 20;
  uint32_t                  max_retries     = 2;
  std::chrono::milliseconds retry_delay{10000};
  uint32_t                  worker_threads  = 4;
  bool                      archive_expired = true;
};

struct HealthSettings {
  uint32_t expiring_soon_days   = 3;
  uint32_t min_sample_size      = 30;
  double   min_confidence       = 0.3;
  double   weight_sum_tolerance = 0.01;
  uint32_t escalation_threshold = 1;
};

struct SchedulerSettings {
  std::chrono::hours learning_interval{24 * 7};
  std::chrono::hours health_interval{24};
  bool               run_on_start = false;
};

struct Settings {
  DetectorSettings  detectors;
  StoreSettings     store;
  LearningSettings  learning;
  HealthSettings    health;
  SchedulerSettings scheduler;
};

// Throws std::runtime_error("Invalid configuration: ...") on out-of-range values.
Settings Resolve(const convintel::runtime::config::RuntimeConfig& config);

std::vector<std::string> DefaultTargetIndustries();

} // namespace convintel::config
