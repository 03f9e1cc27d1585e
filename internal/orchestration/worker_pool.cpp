#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace convintel::orchestration {

WorkerPool::WorkerPool(std::size_t threads) : queue_(std::make_shared<TaskQueue>()), thread_count_(std::max<std::size_t>(threads, 1)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      CONVINTEL_LOG_ERROR("Worker task failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace convintel::orchestration
