#include "interval_job_runner.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace convintel::orchestration {

IntervalJobRunner::IntervalJobRunner(bool run_on_start) : run_on_start_(run_on_start) {
}

IntervalJobRunner::~IntervalJobRunner() {
  Stop();
}

void IntervalJobRunner::RegisterRecurring(const std::string& name, std::chrono::milliseconds interval, Job job) {
  if (interval.count() <= 0) {
    throw util::InvalidArgument("job interval must be positive: " + name);
  }
  {
    std::lock_guard lock(mutex_);
    Entry entry;
    entry.interval = interval;
    entry.job      = std::move(job);
    entry.next_due = run_on_start_ ? SteadyClock::now() : SteadyClock::now() + interval;
    jobs_[name]    = std::move(entry);
  }
  cv_.notify_all();
}

void IntervalJobRunner::TriggerNow(const std::string& name) {
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(name);
    if (it == jobs_.end()) {
      throw util::NotFound("job not registered: " + name);
    }
    it->second.triggered = true;
  }
  cv_.notify_all();
}

void IntervalJobRunner::ReportOutcome(const std::string& name, const JobOutcome& outcome) {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(name);
  if (it == jobs_.end()) return;
  it->second.last = outcome;
}

std::optional<JobOutcome> IntervalJobRunner::LastOutcome(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(name);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.last;
}

void IntervalJobRunner::Start() {
  std::lock_guard lock(mutex_);
  if (started_) return;
  started_  = true;
  stopping_ = false;
  thread_   = std::thread(&IntervalJobRunner::Run, this);
}

void IntervalJobRunner::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  std::lock_guard lock(mutex_);
  started_ = false;
}

void IntervalJobRunner::Execute(const std::string& name, const Job& job) {
  JobOutcome outcome;
  try {
    job();
    outcome.success = true;
  } catch (const std::exception& e) {
    outcome.success = false;
    outcome.detail  = e.what();
    CONVINTEL_LOG_ERROR("Scheduled job failed", {observability::StringField("job", name), observability::StringField("error", e.what())});
  }
  outcome.finished_at = util::Now();
  ReportOutcome(name, outcome);
}

void IntervalJobRunner::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    const auto now = SteadyClock::now();

    std::string due_name;
    for (auto& [name, entry] : jobs_) {
      if (entry.triggered || entry.next_due <= now) {
        due_name = name;
        break;
      }
    }

    if (!due_name.empty()) {
      auto& entry     = jobs_[due_name];
      entry.triggered = false;
      entry.next_due  = now + entry.interval;
      Job job         = entry.job;

      lock.unlock();
      Execute(due_name, job);
      lock.lock();
      continue;
    }

    auto wake = SteadyClock::time_point::max();
    for (const auto& [_, entry] : jobs_) {
      wake = std::min(wake, entry.next_due);
    }
    if (wake == SteadyClock::time_point::max()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, wake);
    }
  }
}

} // namespace convintel::orchestration
