#include "internal/orchestration/task_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/orchestration/interval_job_runner.hpp"
#include "internal/orchestration/worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace {

using convintel::orchestration::IntervalJobRunner;
using convintel::orchestration::TaskQueue;
using convintel::orchestration::WorkerPool;

void TestQueueIsFifoAndDrainsAfterShutdown() {
  TaskQueue        queue;
  std::vector<int> seen;

  assert(queue.Enqueue([&] { seen.push_back(1); }));
  assert(queue.Enqueue([&] { seen.push_back(2); }));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.Enqueue([&] { seen.push_back(3); }));

  while (auto task = queue.Dequeue()) {
    (*task)();
  }
  assert((seen == std::vector<int>{1, 2}));
  assert(!queue.Dequeue().has_value());
}

void TestDequeueWakesOnShutdown() {
  TaskQueue queue;
  auto      waiter = std::async(std::launch::async, [&] { return queue.Dequeue().has_value(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.Shutdown();
  assert(!waiter.get());
}

void TestPoolRunsAllTasks() {
  WorkerPool pool(4);
  pool.Start();
  assert(pool.Threads() == 4);

  std::atomic<int>              sum{0};
  std::vector<std::future<int>> futures;
  for (int i = 1; i <= 50; ++i) {
    futures.push_back(pool.Submit([i, &sum] {
      sum += i;
      return i * 2;
    }));
  }

  int doubled = 0;
  for (auto& f : futures) doubled += f.get();
  assert(doubled == 2550);
  assert(sum == 1275);
  pool.Stop();
}

void TestPoolSurfacesExceptionsThroughFuture() {
  WorkerPool pool(1);
  pool.Start();

  auto failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  bool threw   = false;
  try {
    failing.get();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);

  // the worker survives
  assert(pool.Submit([] { return 7; }).get() == 7);
  pool.Stop();

  threw = false;
  try {
    pool.Submit([] { return 0; });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroThreadsStillRuns() {
  WorkerPool pool(0);
  assert(pool.Threads() == 1);
  pool.Start();
  assert(pool.Submit([] { return 3; }).get() == 3);
}

template <typename Pred>
bool WaitFor(Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

void TestJobRunnerRunsOnStartAndRecordsOutcome() {
  IntervalJobRunner runner(true);
  std::atomic<int>  runs{0};
  runner.RegisterRecurring("learning", std::chrono::hours(1), [&] { ++runs; });
  runner.RegisterRecurring("health", std::chrono::hours(1), [] { throw std::runtime_error("store unavailable"); });
  runner.Start();

  assert(WaitFor([&] { return runs.load() == 1 && runner.LastOutcome("health").has_value(); }));
  runner.Stop();

  assert(runner.LastOutcome("learning")->success);
  const auto failed = runner.LastOutcome("health");
  assert(!failed->success);
  assert(failed->detail == "store unavailable");
  assert(!runner.LastOutcome("unknown").has_value());
}

void TestJobRunnerTriggerNow() {
  IntervalJobRunner runner(false);
  std::atomic<int>  runs{0};
  runner.RegisterRecurring("learning", std::chrono::hours(24), [&] { ++runs; });
  runner.Start();

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(runs == 0);

  runner.TriggerNow("learning");
  assert(WaitFor([&] { return runs.load() == 1; }));
  runner.Stop();

  bool threw = false;
  try {
    runner.TriggerNow("missing");
  } catch (const convintel::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    runner.RegisterRecurring("bad", std::chrono::milliseconds(0), [] {});
  } catch (const convintel::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQueueIsFifoAndDrainsAfterShutdown();
  TestDequeueWakesOnShutdown();
  TestPoolRunsAllTasks();
  TestPoolSurfacesExceptionsThroughFuture();
  TestZeroThreadsStillRuns();
  TestJobRunnerRunsOnStartAndRecordsOutcome();
  TestJobRunnerTriggerNow();

  std::cout << "convintel_unit_task_queue: pass\n";
  return 0;
}
