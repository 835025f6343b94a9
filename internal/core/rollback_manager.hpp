#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/collab/cluster_scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fleet/fleet_state_tracker.hpp"
#include "internal/fleet/teardown_scheduler.hpp"
#include "internal/health/health_gate.hpp"
#include "internal/util/retry.hpp"

namespace rollout::core {

struct RollbackOptions {
  // Bound on waiting for a scaled-down source to regain its replicas.
  util::Millis      restore_timeout{300000};
  util::Millis      poll_interval{1000};
  util::RetryPolicy retry;
};

struct RollbackResult {
  std::string restored_group_id;
  std::string diagnostic;
};

/*
  Returns a service to the version it served before a rollout.

  1. Regain the source group's original capacity (rolling rollouts shrink it).
  2. Re-validate the source with the rollback check suite.
  3. Route 100% to the source, stop mirroring, abort the target and
     schedule its teardown.

  Throws util::IrrecoverableRollout when there is no prior version or the
  source cannot be trusted; traffic is left untouched in the second case.
  Every step is idempotent so a failed attempt can simply be repeated.
*/
class RollbackManager {
 public:
  RollbackManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<fleet::FleetStateTracker> fleet,
                  collab::ClusterSchedulerPtr scheduler, std::shared_ptr<health::HealthGate> gate, health::CheckSuite rollback_suite,
                  std::shared_ptr<fleet::TeardownScheduler> teardown, RollbackOptions options);

  RollbackResult Rollback(const std::string& rollout_id, std::string_view reason, const util::CancelToken* cancel = nullptr);

 private:
  void RestoreCapacity(const rollout::manager::v1::Rollout& rollout, const util::CancelToken* cancel);
  void AbortTarget(const rollout::manager::v1::Rollout& rollout);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<fleet::FleetStateTracker> fleet_;
  collab::ClusterSchedulerPtr               scheduler_;
  std::shared_ptr<health::HealthGate>       gate_;
  health::CheckSuite                        rollback_suite_;
  std::shared_ptr<fleet::TeardownScheduler> teardown_;
  RollbackOptions                           options_;
};

} // namespace rollout::core
