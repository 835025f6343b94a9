#include "teardown_scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rollout::fleet {

namespace v1 = rollout::manager::v1;

TeardownScheduler::TeardownScheduler(std::shared_ptr<runtime::TaskQueue> queue, collab::ClusterSchedulerPtr scheduler,
                                     std::shared_ptr<FleetStateTracker> fleet, std::shared_ptr<traffic::TrafficSplitter> splitter,
                                     util::Millis grace, util::RetryPolicy retry)
    : queue_(std::move(queue)),
      scheduler_(std::move(scheduler)),
      fleet_(std::move(fleet)),
      splitter_(std::move(splitter)),
      grace_(grace),
      retry_(retry) {
}

void TeardownScheduler::Schedule(const std::string& group_id) {
  ROLLOUT_LOG_INFO("teardown scheduled",
                   {observability::StringField("group_id", group_id), observability::IntField("grace_ms", grace_.count())});

  queue_->PostAfter(grace_, "teardown", [this, group_id] { TeardownNow(group_id); });
}

bool TeardownScheduler::TeardownNow(const std::string& group_id) {
  const auto group = fleet_->Find(group_id);
  if (!group || group->lifecycle_state() == v1::LIFECYCLE_STATE_TERMINATED) {
    return false;
  }

  const auto weight = splitter_->GetWeights(group->service_name())->WeightOf(group_id);
  if (weight > 0) {
    ROLLOUT_LOG_WARN("teardown skipped, group still receives traffic",
                     {observability::StringField("group_id", group_id), observability::IntField("weight", weight)});
    return false;
  }

  try {
    util::RetryTransient(retry_, "scheduler.terminate", [&] { scheduler_->TerminateInstanceGroup(group_id); });
  } catch (const util::NotFound&) {
    // never provisioned on the cluster side
  }

  splitter_->RemoveGroup(group->service_name(), group_id);
  fleet_->SetLifecycle(group_id, v1::LIFECYCLE_STATE_TERMINATED);

  ROLLOUT_LOG_INFO("instance group terminated",
                   {observability::StringField("group_id", group_id), observability::StringField("service", group->service_name())});
  return true;
}

std::size_t TeardownScheduler::RescheduleAll() {
  std::size_t queued = 0;
  for (const auto& group : fleet_->List("", false)) {
    if (group.lifecycle_state() == v1::LIFECYCLE_STATE_RETIRING || group.lifecycle_state() == v1::LIFECYCLE_STATE_ABORTED) {
      Schedule(group.id());
      ++queued;
    }
  }
  return queued;
}

} // namespace rollout::fleet
