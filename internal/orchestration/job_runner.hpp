#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace convintel::orchestration {

struct JobOutcome {
  bool            success = false;
  std::string     detail;
  util::TimePoint finished_at{};
};

/*
  Scheduling seam for the recurring jobs (weekly learning, daily health).

  The in-process IntervalJobRunner is the only implementation shipped;
  a deployment can put an external scheduler behind the same interface.
*/
class JobRunner {
 public:
  using Job = std::function<void()>;

  virtual ~JobRunner() = default;

  virtual void RegisterRecurring(const std::string& name, std::chrono::milliseconds interval, Job job) = 0;

  // Runs the job as soon as the runner is free. Throws util::NotFound.
  virtual void TriggerNow(const std::string& name) = 0;

  virtual void ReportOutcome(const std::string& name, const JobOutcome& outcome) = 0;

  virtual std::optional<JobOutcome> LastOutcome(const std::string& name) const = 0;

  virtual void Start() = 0;
  virtual void Stop()  = 0;
};

} // namespace convintel::orchestration
