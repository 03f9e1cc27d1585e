#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "task_queue.hpp"

namespace convintel::orchestration {

/*
  Fixed set of threads draining a TaskQueue.

  Submit() wraps the callable in a packaged_task, so exceptions surface
  through the returned future rather than on the worker thread.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  void Start();

  // Drains queued tasks, then joins.
  void Stop();

  std::size_t Threads() const {
    return thread_count_;
  }

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut  = task->get_future();
    if (!queue_->Enqueue([task] { (*task)(); })) {
      throw std::runtime_error("worker pool is stopped");
    }
    return fut;
  }

 private:
  void Run();

  std::shared_ptr<TaskQueue> queue_;
  std::size_t                thread_count_;
  std::vector<std::thread>   threads_;
  std::atomic<bool>          running_{false};
};

} // namespace convintel::orchestration
