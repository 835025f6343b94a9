#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace rollout::runtime {

struct Task {
  std::string           name;
  std::function<void()> fn;
};

/*
  Thread-safe blocking queue with delayed delivery.

  Tasks become visible to Dequeue() once their due time passes; tasks with
  the same due time keep submission order. Shutdown() drops anything not yet
  delivered.
*/
class TaskQueue {
 public:
  void Post(std::string name, std::function<void()> fn);
  void PostAfter(util::Millis delay, std::string name, std::function<void()> fn);

  // blocking wait; nullopt once shut down
  std::optional<Task> Dequeue();

  void Shutdown();

  bool IsShutdown() const;

  std::size_t Size() const;

 private:
  struct Entry {
    util::SteadyClock::time_point due;
    uint64_t                      seq = 0;
    Task                          task;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      return a.due != b.due ? a.due > b.due : a.seq > b.seq;
    }
  };

  mutable std::mutex                                 mutex_;
  std::condition_variable                            cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  uint64_t                                           next_seq_ = 0;
  bool                                               shutdown_ = false;
};

} // namespace rollout::runtime
