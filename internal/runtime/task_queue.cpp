#include "task_queue.hpp"

namespace rollout::runtime {

void TaskQueue::Post(std::string name, std::function<void()> fn) {
  PostAfter(util::Millis(0), std::move(name), std::move(fn));
}

void TaskQueue::PostAfter(util::Millis delay, std::string name, std::function<void()> fn) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(Entry{util::SteadyClock::now() + delay, next_seq_++, Task{std::move(name), std::move(fn)}});
  }
  cv_.notify_one();
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (shutdown_) return std::nullopt;

    if (queue_.empty()) {
      cv_.wait(lock);
      continue;
    }

    const auto due = queue_.top().due;
    if (due <= util::SteadyClock::now()) {
      Task task = queue_.top().task;
      queue_.pop();
      // a later-due head may now be runnable by another worker
      if (!queue_.empty()) cv_.notify_one();
      return task;
    }

    cv_.wait_until(lock, due);
  }
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    queue_    = {};
  }
  cv_.notify_all();
}

bool TaskQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace rollout::runtime
