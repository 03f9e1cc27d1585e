#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/detectors/detector.hpp"
#include "internal/health/health_monitor.hpp"
#include "internal/orchestration/backfill_flow.hpp"
#include "internal/orchestration/job_runner.hpp"
#include "internal/orchestration/learning_orchestrator.hpp"
#include "internal/orchestration/worker_pool.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/store/pattern_store.hpp"
#include "internal/store/weight_cache.hpp"

namespace convintel::factory {

inline constexpr const char* kLearningJob = "learning";
inline constexpr const char* kHealthJob   = "health";

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process; the worker pool is started by Build().
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<store::PatternStore> store;
  std::shared_ptr<store::WeightCache>  weight_cache;

  std::shared_ptr<orchestration::WorkerPool>           pool;
  std::shared_ptr<orchestration::LearningOrchestrator> orchestrator;
  std::shared_ptr<orchestration::BackfillFlow>         backfill;
  std::shared_ptr<health::HealthMonitor>               health;

  std::shared_ptr<service::AdminService> admin_service;
};

/*
  Build

  Composition root. The only place that knows concrete repository types.
*/
Application Build(const convintel::runtime::config::RuntimeConfig& config);

// Same graph over a caller-supplied repository (tests, tooling).
Application Build(const convintel::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

// Opens the configured backend and brings its schema up to date.
std::shared_ptr<db::Repository> BuildRepository(const convintel::runtime::config::RuntimeConfig& config);

std::vector<std::shared_ptr<const detectors::Detector>> BuildDetectors(const config::DetectorSettings& settings);

// Registers the recurring learning and health jobs.
void RegisterJobs(orchestration::JobRunner& runner, const Application& app);

} // namespace convintel::factory
