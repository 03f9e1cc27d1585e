#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace convintel::orchestration {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class TaskQueue {
 public:
  // false once shut down; the task is dropped
  bool Enqueue(Task task);

  // blocking wait; nullopt after shutdown once drained
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace convintel::orchestration
