#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/artifact/artifact_resolver.hpp"
#include "internal/collab/cluster_scheduler.hpp"
#include "internal/collab/metrics_source.hpp"
#include "internal/collab/notifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fleet/fleet_state_tracker.hpp"
#include "internal/fleet/teardown_scheduler.hpp"
#include "internal/health/health_gate.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/strategy/traffic_plan.hpp"
#include "internal/util/retry.hpp"
#include "rollback_manager.hpp"

namespace rollout::runtime::config {
class RuntimeConfig;
}

namespace rollout::core {

struct ControllerOptions {
  std::string  controller_id;
  std::size_t  worker_threads = 4;
  util::Millis provision_timeout{300000};
  util::Millis provision_poll_interval{1000};
  util::Millis rollout_timeout{7200000};
  util::Millis default_tick_interval{30000};
  util::Millis lease_renew_interval{10000};

  util::RetryPolicy retry;

  // Empty allows every service.
  std::vector<std::string> allowed_services;

  static ControllerOptions FromConfig(const rollout::runtime::config::RuntimeConfig& config);
};

struct ControllerDependencies {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<lease::LeaseManager>         leases;
  std::shared_ptr<artifact::ArtifactResolver>  resolver;
  std::shared_ptr<fleet::FleetStateTracker>    fleet;
  std::shared_ptr<traffic::TrafficSplitter>    splitter;
  std::shared_ptr<health::HealthGate>          gate;
  health::CheckSuite                           checks;
  std::shared_ptr<RollbackManager>             rollback;
  std::shared_ptr<fleet::TeardownScheduler>    teardown;
  collab::ClusterSchedulerPtr                  scheduler;
  collab::MetricsSourcePtr                     metrics;
  collab::NotifierPtr                          notifier;

  // Drives, soak ticks and teardowns run here.
  std::shared_ptr<runtime::TaskQueue> queue;
};

struct SubmitResult {
  rollout::manager::v1::Rollout rollout;
  // false when an earlier submission with the same idempotency key was replayed
  bool created = false;
};

/*
  Rollout Controller.

  Owns the lifecycle of every rollout this process holds a service lease
  for. Each rollout is driven by an execution: a mailbox of events (advance,
  alert, abort, halt decision) drained one at a time on the worker pool, so
  events for one rollout never interleave while different rollouts proceed
  in parallel.

  Every state change is a versioned write of the rollout row plus an
  append to its history, committed only while the service lease is still
  held. A controller that loses its lease stops without writing.
*/
class RolloutController {
 public:
  RolloutController(ControllerDependencies deps, ControllerOptions options);
  ~RolloutController();

  RolloutController(const RolloutController&)            = delete;
  RolloutController& operator=(const RolloutController&) = delete;

  // Subscribes to metric alerts, adopts orphaned rollouts and starts the worker pool.
  void Start();

  // Stops driving. Leases are left to expire so another controller can resume.
  void Stop();

  SubmitResult Submit(const rollout::manager::v1::RolloutRequest& request);

  rollout::manager::v1::Rollout Get(const std::string& rollout_id);

  std::vector<rollout::manager::v1::Rollout> List(const std::string& service_name, bool include_terminal);

  // Acknowledged asynchronously; the returned rollout is the state at the time of the call.
  rollout::manager::v1::Rollout Abort(const std::string& rollout_id, const std::string& reason);

  rollout::manager::v1::Rollout ResolveHalt(const std::string& rollout_id, rollout::manager::v1::HaltDecision decision);

  // Blue-green rollout back to the artifact promoted before the current one.
  SubmitResult Revert(const std::string& service_name, const std::string& idempotency_key);

  /*
    Adopts non-terminal rollouts whose lease is expired or already held by
    this controller id. Called on start and periodically by the watchdog.
    Returns how many rollouts were adopted.
  */
  std::size_t Recover();

  void OnAlert(const rollout::manager::v1::MetricAlert& alert);

  std::size_t ActiveExecutions() const;

  const ControllerOptions& Options() const {
    return options_;
  }

 private:
  enum class EventKind {
    kAdvance,
    kAlert,
    kAbort,
    kHaltDecision,
  };

  struct Event {
    EventKind                          kind = EventKind::kAdvance;
    std::string                        detail;
    rollout::manager::v1::HaltDecision decision = rollout::manager::v1::HALT_DECISION_UNSPECIFIED;
  };

  struct Execution {
    std::string rollout_id;
    std::string service_name;

    // strand-only
    lease::Lease                  lease;
    util::SteadyClock::time_point next_renew{};

    std::mutex         mutex;
    std::deque<Event>  mailbox;
    bool               draining         = false;
    bool               finished         = false;
    uint64_t           timer_generation = 0;

    std::shared_ptr<util::CancelToken> cancel = std::make_shared<util::CancelToken>();
    std::atomic<bool>                  interrupted{false};
  };

  using ExecutionPtr = std::shared_ptr<Execution>;

  // What the strand does after handling an event.
  struct Next {
    enum class Kind {
      kNow,
      kAfter,
      kIdle,
      kDone,
    };

    Kind         kind = Kind::kIdle;
    util::Millis delay{0};

    static Next Now() {
      return {Kind::kNow, util::Millis(0)};
    }
    static Next After(util::Millis delay) {
      return {Kind::kAfter, delay};
    }
    static Next Idle() {
      return {Kind::kIdle, util::Millis(0)};
    }
    static Next Done() {
      return {Kind::kDone, util::Millis(0)};
    }
  };

  using Mutation = std::function<void(rollout::manager::v1::Rollout&)>;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------
  ExecutionPtr StartExecution(const rollout::manager::v1::Rollout& rollout, const lease::Lease& lease);
  ExecutionPtr FindExecution(const std::string& rollout_id) const;
  ExecutionPtr EnsureExecution(const db::model::RolloutRecord& record);
  void         Enqueue(const ExecutionPtr& exec, Event event);
  void         Drain(const ExecutionPtr& exec);
  void         Handle(const ExecutionPtr& exec, const Event& event);
  void         Apply(const ExecutionPtr& exec, Next next);
  void         ScheduleAdvance(const ExecutionPtr& exec, util::Millis delay);
  void         Interrupt(const ExecutionPtr& exec);
  void         ResetInterrupt(Execution& exec);
  void         Finish(const ExecutionPtr& exec, bool release_lease);
  bool         Adopt(const db::model::RolloutRecord& record);

  // ---------------------------------------------------------------------
  // Event handlers
  // ---------------------------------------------------------------------
  Next Drive(Execution& exec);
  Next HandleAlert(Execution& exec, const Event& event);
  Next HandleAbort(Execution& exec, const Event& event);
  Next HandleHaltDecision(Execution& exec, const Event& event);
  Next HandleFailure(Execution& exec, const std::exception& error);

  Next DrivePending(Execution& exec, const rollout::manager::v1::Rollout& rollout);
  Next DriveProvisioning(Execution& exec, rollout::manager::v1::Rollout rollout);
  Next DriveValidating(Execution& exec, const rollout::manager::v1::Rollout& rollout);
  Next DriveShifting(Execution& exec, const rollout::manager::v1::Rollout& rollout);
  Next DriveBatch(Execution& exec, rollout::manager::v1::Rollout rollout, const strategy::TrafficPlan& plan);
  Next DriveSoaking(Execution& exec, const rollout::manager::v1::Rollout& rollout);
  Next DriveRollingBack(Execution& exec, const rollout::manager::v1::Rollout& rollout);

  Next Promote(Execution& exec, const rollout::manager::v1::Rollout& rollout);
  Next HaltBatch(Execution& exec, const rollout::manager::v1::Rollout& rollout, const std::string& diagnostic);
  Next BeginRollback(Execution& exec, const rollout::manager::v1::Rollout& rollout, rollout::manager::v1::ReasonCode reason,
                     const std::string& diagnostic);

  // Breach reason and diagnostic, if the soak window should be cut short.
  std::optional<std::pair<rollout::manager::v1::ReasonCode, std::string>> EvaluateSoak(const rollout::manager::v1::Rollout& rollout,
                                                                                       util::Millis window);

  // ---------------------------------------------------------------------
  // Persistence
  // ---------------------------------------------------------------------
  rollout::manager::v1::Rollout Load(const std::string& rollout_id);

  rollout::manager::v1::Rollout Transition(Execution& exec, const rollout::manager::v1::Rollout& current,
                                           rollout::manager::v1::RolloutState to, rollout::manager::v1::ReasonCode reason,
                                           const std::string& diagnostic, const Mutation& mutate = {});

  // History entry with from == to; no state change.
  rollout::manager::v1::Rollout Annotate(Execution& exec, const rollout::manager::v1::Rollout& current,
                                         rollout::manager::v1::ReasonCode reason, const std::string& diagnostic,
                                         const Mutation& mutate = {});

  // Versioned write without a history entry.
  rollout::manager::v1::Rollout Update(Execution& exec, const rollout::manager::v1::Rollout& current, const Mutation& mutate);

  rollout::manager::v1::Rollout Write(Execution& exec, const rollout::manager::v1::Rollout& current, const Mutation& mutate,
                                      std::optional<rollout::manager::v1::HistoryEntry> entry);

  // Caller holds `tx` and has verified the lease.
  rollout::manager::v1::Rollout WriteInTx(db::Transaction& tx, const rollout::manager::v1::Rollout& current, const Mutation& mutate,
                                          std::optional<rollout::manager::v1::HistoryEntry>* entry);

  void Published(const rollout::manager::v1::Rollout& rollout, const rollout::manager::v1::HistoryEntry& entry);

  rollout::manager::v1::Rollout Assemble(db::Transaction& tx, const db::model::RolloutRecord& record);

  // ---------------------------------------------------------------------
  // Helpers
  // ---------------------------------------------------------------------
  strategy::TrafficPlan PlanFor(const rollout::manager::v1::Rollout& rollout) const;
  util::Millis          ProvisionTimeout(const rollout::manager::v1::Rollout& rollout) const;
  util::Millis          TickInterval(const rollout::manager::v1::Rollout& rollout) const;
  void                  RenewIfDue(Execution& exec);
  void                  ScaleGroup(Execution& exec, const std::string& group_id, uint32_t replicas);
  // Throws util::UnexpectedTermination if the cluster has terminated the group.
  rollout::manager::v1::InstanceGroup RefreshGroup(Execution& exec, const std::string& group_id);
  std::map<std::string, uint32_t> SplitFor(const rollout::manager::v1::Rollout& rollout, uint32_t target_percent) const;
  void                  CheckServiceAllowed(const std::string& service_name) const;

  ControllerDependencies deps_;
  ControllerOptions      options_;
  runtime::WorkerPool    pool_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};

  // Serializes the check-then-insert part of Submit with adoption within this process.
  std::mutex submit_mutex_;

  mutable std::mutex                             executions_mutex_;
  std::unordered_map<std::string, ExecutionPtr> executions_;
};

} // namespace rollout::core
