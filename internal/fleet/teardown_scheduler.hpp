#pragma once

#include <memory>
#include <string>

#include "fleet_state_tracker.hpp"
#include "internal/collab/cluster_scheduler.hpp"
#include "internal/runtime/task_queue.hpp"
#include "internal/traffic/traffic_splitter.hpp"
#include "internal/util/retry.hpp"

namespace rollout::fleet {

/*
  Terminates retired and aborted groups after a grace period.

  A group still holding traffic is never terminated; the request is logged
  and dropped. Pending teardowns do not survive a restart; recovery
  reschedules every RETIRING or ABORTED group it finds.
*/
class TeardownScheduler {
 public:
  TeardownScheduler(std::shared_ptr<runtime::TaskQueue> queue, collab::ClusterSchedulerPtr scheduler,
                    std::shared_ptr<FleetStateTracker> fleet, std::shared_ptr<traffic::TrafficSplitter> splitter, util::Millis grace,
                    util::RetryPolicy retry);

  void Schedule(const std::string& group_id);

  // Returns false when the group was skipped (still weighted, already gone).
  bool TeardownNow(const std::string& group_id);

  // Schedules every RETIRING or ABORTED group. Returns how many were queued.
  std::size_t RescheduleAll();

 private:
  std::shared_ptr<runtime::TaskQueue>       queue_;
  collab::ClusterSchedulerPtr               scheduler_;
  std::shared_ptr<FleetStateTracker>        fleet_;
  std::shared_ptr<traffic::TrafficSplitter> splitter_;
  util::Millis                              grace_;
  util::RetryPolicy                         retry_;
};

} // namespace rollout::fleet
