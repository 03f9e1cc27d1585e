#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "job_runner.hpp"

namespace convintel::orchestration {

/*
  One scheduler thread; due jobs run sequentially on it. A job that
  throws is reported as failed and rescheduled like any other run.
*/
class IntervalJobRunner final : public JobRunner {
 public:
  explicit IntervalJobRunner(bool run_on_start);
  ~IntervalJobRunner() override;

  void RegisterRecurring(const std::string& name, std::chrono::milliseconds interval, Job job) override;
  void TriggerNow(const std::string& name) override;
  void ReportOutcome(const std::string& name, const JobOutcome& outcome) override;
  std::optional<JobOutcome> LastOutcome(const std::string& name) const override;

  void Start() override;
  void Stop() override;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    std::chrono::milliseconds interval{0};
    Job                       job;
    SteadyClock::time_point   next_due{};
    bool                      triggered = false;
    std::optional<JobOutcome> last;
  };

  void Run();
  void Execute(const std::string& name, const Job& job);

  bool run_on_start_;

  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::map<std::string, Entry> jobs_;
  bool                         stopping_ = false;
  bool                         started_  = false;
  std::thread                  thread_;
};

} // namespace convintel::orchestration
