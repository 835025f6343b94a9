#pragma once

#include <mutex>
#include <vector>

#include "internal/collab/notifier.hpp"

namespace rollout::collab::sim {

// Keeps every event in memory, then hands it to `next` if set.
class RecordingNotifier final : public Notifier {
 public:
  explicit RecordingNotifier(NotifierPtr next = nullptr) : next_(std::move(next)) {
  }

  void Notify(const rollout::manager::v1::RolloutEvent& event) override {
    {
      std::lock_guard lock(mutex_);
      events_.push_back(event);
    }
    if (next_) next_->Notify(event);
  }

  std::vector<rollout::manager::v1::RolloutEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  NotifierPtr                                     next_;
  mutable std::mutex                              mutex_;
  std::vector<rollout::manager::v1::RolloutEvent> events_;
};

} // namespace rollout::collab::sim
