#include "rollback_manager.hpp"

#include <optional>

#include "internal/db/api/result_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace rollout::core {

namespace v1 = rollout::manager::v1;

RollbackManager::RollbackManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<fleet::FleetStateTracker> fleet,
                                 collab::ClusterSchedulerPtr scheduler, std::shared_ptr<health::HealthGate> gate,
                                 health::CheckSuite rollback_suite, std::shared_ptr<fleet::TeardownScheduler> teardown,
                                 RollbackOptions options)
    : repository_(std::move(repository)),
      fleet_(std::move(fleet)),
      scheduler_(std::move(scheduler)),
      gate_(std::move(gate)),
      rollback_suite_(std::move(rollback_suite)),
      teardown_(std::move(teardown)),
      options_(options) {
}

void RollbackManager::AbortTarget(const v1::Rollout& rollout) {
  if (rollout.target_group_id().empty()) return;

  const auto target = fleet_->Find(rollout.target_group_id());
  if (!target || !model::IsLive(target->lifecycle_state())) return;

  const auto& service = rollout.request().service_name();
  if (target->mirrored()) fleet_->SetMirror(service, target->id(), false);

  if (target->lifecycle_state() != v1::LIFECYCLE_STATE_ABORTED) {
    fleet_->SetLifecycle(target->id(), v1::LIFECYCLE_STATE_ABORTED);
  }
  teardown_->Schedule(target->id());
}

void RollbackManager::RestoreCapacity(const v1::Rollout& rollout, const util::CancelToken* cancel) {
  const auto& source_id = rollout.source_group_id();
  auto        source    = fleet_->Find(source_id);
  if (!source || rollout.source_replicas() == 0 || source->desired_replicas() >= rollout.source_replicas()) return;

  ROLLOUT_LOG_INFO("restoring source capacity", {observability::StringField("group_id", source_id),
                                                 observability::IntField("from", source->desired_replicas()),
                                                 observability::IntField("to", rollout.source_replicas())});

  util::RetryTransient(
      options_.retry, "scheduler.scale", [&] { scheduler_->ScaleInstanceGroup(source_id, rollout.source_replicas()); }, cancel);
  fleet_->SetDesiredReplicas(source_id, rollout.source_replicas());

  const auto deadline = util::SteadyClock::now() + options_.restore_timeout;
  for (;;) {
    const auto group =
        util::RetryTransient(options_.retry, "scheduler.status", [&] { return fleet_->RefreshReadiness(source_id); }, cancel);
    if (group.ready_replicas() >= group.desired_replicas()) return;

    if (util::SteadyClock::now() >= deadline) {
      throw util::IrrecoverableRollout("source group " + source_id + " did not regain " + std::to_string(rollout.source_replicas()) +
                                       " ready replicas");
    }
    if (cancel != nullptr ? cancel->WaitFor(options_.poll_interval) : util::CancelToken().WaitFor(options_.poll_interval)) {
      throw util::Unavailable("rollback interrupted while restoring capacity");
    }
  }
}

RollbackResult RollbackManager::Rollback(const std::string& rollout_id, std::string_view reason, const util::CancelToken* cancel) {
  observability::SpanScope span("rollback");
  span.SetAttribute("rollout_id", rollout_id);
  span.SetAttribute("reason", reason);

  std::optional<db::model::RolloutRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetRollout(*tx, rollout_id);
    tx->Commit();
  }
  if (!record) {
    throw util::NotFound("rollout not found: " + rollout_id);
  }

  const auto& rollout = record->body;
  const auto& service = rollout.request().service_name();

  ROLLOUT_LOG_INFO("rollback started", {observability::StringField("rollout_id", rollout_id),
                                        observability::StringField("service", service), observability::StringField("reason", reason)});

  const auto source = rollout.source_group_id().empty() ? std::nullopt : fleet_->Find(rollout.source_group_id());
  if (!source) {
    // first deploy: nothing to go back to, take the target out of service
    fleet_->SetWeights(service, {});
    AbortTarget(rollout);
    throw util::IrrecoverableRollout("no prior version of " + service + " to restore");
  }
  if (!model::IsLive(source->lifecycle_state()) || source->lifecycle_state() == v1::LIFECYCLE_STATE_ABORTED) {
    throw util::IrrecoverableRollout("source group " + source->id() + " is " + std::string(model::ToString(source->lifecycle_state())));
  }

  try {
    RestoreCapacity(rollout, cancel);
  } catch (const util::UnexpectedTermination& e) {
    throw util::IrrecoverableRollout(std::string("source group lost: ") + e.what());
  }

  const auto fresh = fleet_->Find(source->id());
  const auto gate  = gate_->Evaluate(*fresh, rollback_suite_, cancel);
  if (!gate.passed) {
    if (cancel != nullptr && cancel->IsCancelled()) {
      throw util::Unavailable("rollback interrupted during source validation");
    }
    throw util::IrrecoverableRollout("source group " + source->id() + " failed re-validation: " + gate.Summary());
  }

  fleet_->SetWeights(service, {{source->id(), 100}});
  AbortTarget(rollout);

  RollbackResult result;
  result.restored_group_id = source->id();
  result.diagnostic        = "restored " + source->artifact().name() + "@" + source->artifact().version() + " on " + source->id();

  ROLLOUT_LOG_INFO("rollback completed", {observability::StringField("rollout_id", rollout_id),
                                          observability::StringField("restored_group", source->id())});
  return result;
}

} // namespace rollout::core
