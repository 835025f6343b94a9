#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace rollout::runtime {

/*
  Fixed set of threads draining a TaskQueue.

  Runs controller drives, soak ticks, teardowns, health checks and
  notification delivery depending on which queue it is given.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<TaskQueue> queue, std::size_t threads, std::string name);
  ~WorkerPool();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<TaskQueue> queue_;
  std::size_t                thread_count_;
  std::string                name_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace rollout::runtime
