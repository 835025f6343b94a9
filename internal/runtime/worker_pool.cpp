#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace rollout::runtime {

WorkerPool::WorkerPool(std::shared_ptr<TaskQueue> queue, std::size_t threads, std::string name)
    : queue_(std::move(queue)), thread_count_(std::max<std::size_t>(threads, 1)), name_(std::move(name)) {
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
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      task->fn();
    } catch (const std::exception& e) {
      ROLLOUT_LOG_ERROR("background task failed",
                        {observability::StringField("pool", name_), observability::StringField("task", task->name),
                         observability::StringField("error", e.what())});
    }
  }
}

} // namespace rollout::runtime
