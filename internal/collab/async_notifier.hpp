#pragma once

#include <memory>

#include "internal/runtime/task_queue.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "notifier.hpp"

namespace rollout::collab {

/*
  Delivers events to the wrapped notifier on a dedicated thread so a slow
  or failing channel never blocks a state transition. Delivery order
  matches Notify() order.
*/
class AsyncNotifier final : public Notifier {
 public:
  explicit AsyncNotifier(NotifierPtr inner);
  ~AsyncNotifier() override;

  void Notify(const rollout::manager::v1::RolloutEvent& event) override;

  void Stop();

 private:
  NotifierPtr                         inner_;
  std::shared_ptr<runtime::TaskQueue> queue_;
  runtime::WorkerPool                 pool_;
};

} // namespace rollout::collab
