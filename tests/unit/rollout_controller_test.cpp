#include "internal/core/rollout_controller.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1  = rollout::manager::v1;
namespace cfg = rollout::runtime::config;

using rollout::factory::Engine;
using rollout::util::Millis;
using rollout::util::SteadyClock;

constexpr const char* kConfig = R"(controller:
  worker_threads: 4
  provision_timeout: "3s"
  provision_poll_interval: "0.01s"
  rollout_timeout: "120s"
  default_tick_interval: "0.02s"
  teardown_grace: "0.02s"
  watchdog_interval: "0.05s"
  retry:
    max_attempts: 3
    initial_backoff: "0.005s"
    max_backoff: "0.02s"
    multiplier: 2
leases:
  ttl: "0.5s"
  renew_interval: "0.1s"
health_gate:
  worker_threads: 4
  grace: "0.1s"
  checks:
    - name: liveness
      kind: CHECK_KIND_LIVENESS
      timeout: "1s"
    - name: readiness
      kind: CHECK_KIND_READINESS
      timeout: "1s"
  rollback_checks:
    - name: liveness
      kind: CHECK_KIND_LIVENESS
      timeout: "1s"
collaborators:
  simulation:
    ready_delay: "0.02s"
    baseline_metrics:
      error_rate: 0.01
      latency_p99_ms: 120
    artifacts:
      - name: checkout
        version: "1.0.0"
        resource_spec:
          replicas: 3
      - name: checkout
        version: "2.0.0"
        resource_spec:
          replicas: 3
      - name: checkout
        version: "3.0.0"
        resource_spec:
          replicas: 3
)";

cfg::RuntimeConfig Config(const std::string& controller_id) {
  auto config = rollout::config::ConfigLoader::LoadFromYamlString(kConfig);
  config.mutable_controller()->set_controller_id(controller_id);
  return config;
}

// One running controller process. Stopped on scope exit.
struct Harness {
  explicit Harness(std::shared_ptr<rollout::db::Repository> repository = nullptr, const rollout::collab::sim::SimEnvironment* sim = nullptr,
                   const std::string& controller_id = "ctl-a")
      : engine(rollout::factory::Build(Config(controller_id), std::move(repository), sim)) {
    engine.Start();
  }

  explicit Harness(const cfg::RuntimeConfig& config) : engine(rollout::factory::Build(config)) {
    engine.Start();
  }

  ~Harness() {
    Stop();
  }

  void Stop() {
    if (stopped) return;
    stopped = true;
    engine.Stop();
  }

  rollout::core::RolloutController& Controller() {
    return *engine.controller;
  }

  Engine engine;
  bool   stopped = false;
};

v1::RolloutRequest Request(const std::string& version, v1::Strategy strategy, const std::string& key, Millis soak = Millis(50)) {
  v1::RolloutRequest request;
  request.set_service_name("checkout");
  request.mutable_target_artifact()->set_name("checkout");
  request.mutable_target_artifact()->set_version(version);
  request.set_strategy(strategy);
  request.set_idempotency_key(key);
  *request.mutable_strategy_params()->mutable_soak_duration() = rollout::util::ToProto(soak);
  return request;
}

bool WaitFor(const std::function<bool()>& done, Millis timeout = Millis(10000)) {
  const auto deadline = SteadyClock::now() + timeout;
  while (SteadyClock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

bool WaitForState(Harness& h, const std::string& rollout_id, v1::RolloutState state) {
  return WaitFor([&] { return h.Controller().Get(rollout_id).state() == state; });
}

bool HasReason(const v1::Rollout& rollout, v1::ReasonCode reason, const std::string& needle = "") {
  for (const auto& entry : rollout.history()) {
    if (entry.reason() == reason && entry.diagnostic().find(needle) != std::string::npos) return true;
  }
  return false;
}

int CountReason(const v1::Rollout& rollout, v1::ReasonCode reason) {
  int count = 0;
  for (const auto& entry : rollout.history()) {
    if (entry.reason() == reason) ++count;
  }
  return count;
}

v1::LifecycleState LifecycleOf(Harness& h, const std::string& group_id) {
  const auto group = h.engine.fleet->Find(group_id);
  return group ? group->lifecycle_state() : v1::LIFECYCLE_STATE_UNSPECIFIED;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

// Blue-green deploy of 1.0.0 with no prior version; returns the serving group.
std::string DeployFirst(Harness& h) {
  const auto result = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "first-deploy"));
  assert(WaitForState(h, result.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));
  return h.Controller().Get(result.rollout.id()).target_group_id();
}

void TestBlueGreenFirstDeployPromotes() {
  Harness h;

  const auto result = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "bg-1"));
  assert(result.created);
  assert(result.rollout.state() == v1::ROLLOUT_STATE_PENDING);
  assert(result.rollout.history_size() == 1);
  assert(result.rollout.history(0).reason() == v1::REASON_CODE_ACCEPTED);
  assert(result.rollout.source_group_id().empty());

  assert(WaitForState(h, result.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));
  const auto rollout = h.Controller().Get(result.rollout.id());
  const auto target  = rollout.target_group_id();
  assert(!target.empty());
  assert(rollout.traffic().weights().at(target) == 100);

  for (auto reason : {v1::REASON_CODE_ARTIFACT_RESOLVED, v1::REASON_CODE_GROUP_CREATED, v1::REASON_CODE_GROUP_READY,
                      v1::REASON_CODE_HEALTH_GATE_PASSED, v1::REASON_CODE_TRAFFIC_SHIFTED, v1::REASON_CODE_PROMOTED}) {
    assert(HasReason(rollout, reason));
  }
  for (int i = 0; i < rollout.history_size(); ++i) {
    assert(rollout.history(i).seq() == static_cast<uint64_t>(i + 1));
  }

  const auto group = h.engine.fleet->Find(target);
  assert(group->lifecycle_state() == v1::LIFECYCLE_STATE_SERVING);
  assert(group->ready_replicas() == 3);
  assert(h.engine.fleet->ServingGroup("checkout")->id() == target);

  // the lease goes with the execution
  assert(WaitFor([&] {
    auto       tx    = h.engine.repository->Begin();
    const auto lease = h.engine.repository->GetLease(*tx, "checkout");
    tx->Commit();
    return !lease.has_value();
  }));
  assert(h.Controller().ActiveExecutions() == 0);
}

void TestCanaryRampPromotesAndRetiresSource() {
  Harness    h;
  const auto source = DeployFirst(h);

  auto  request = Request("2.0.0", v1::STRATEGY_CANARY, "canary-1");
  auto* params  = request.mutable_strategy_params();
  params->set_canary_percent(10);
  params->add_ramp_steps(50);
  params->add_ramp_steps(100);
  *params->mutable_step_soak_duration() = rollout::util::ToProto(Millis(30));
  auto* threshold                        = params->add_thresholds();
  threshold->set_metric("error_rate");
  threshold->set_comparator(v1::THRESHOLD_COMPARATOR_MAX);
  threshold->set_limit(0.05);

  const auto result = h.Controller().Submit(request);
  assert(result.rollout.source_group_id() == source);
  assert(WaitForState(h, result.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));

  const auto rollout = h.Controller().Get(result.rollout.id());
  assert(CountReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED) == 3);
  assert(CountReason(rollout, v1::REASON_CODE_STEP_ADVANCED) == 2);
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "target at 10%"));
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "target at 50%"));
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "target at 100%"));

  const auto weights = h.engine.splitter->GetWeights("checkout");
  assert(weights->WeightOf(rollout.target_group_id()) == 100);
  assert(weights->WeightOf(source) == 0);

  assert(WaitFor([&] { return LifecycleOf(h, source) == v1::LIFECYCLE_STATE_TERMINATED; }));
  const auto terminated = h.engine.sim.scheduler->TerminatedGroups();
  assert(std::find(terminated.begin(), terminated.end(), source) != terminated.end());
}

void TestCanaryRollsBackOnThresholdBreach() {
  Harness    h;
  const auto source = DeployFirst(h);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "canary-breach", Millis(30000));
  request.mutable_strategy_params()->set_canary_percent(20);
  auto* threshold = request.mutable_strategy_params()->add_thresholds();
  threshold->set_metric("error_rate");
  threshold->set_comparator(v1::THRESHOLD_COMPARATOR_MAX);
  threshold->set_limit(0.05);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_SOAKING));

  const auto target = h.Controller().Get(id).target_group_id();
  auto       split  = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(target) == 20);
  assert(split->WeightOf(source) == 80);

  h.engine.sim.metrics->SetGroupMetric(target, "error_rate", 0.3);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_SOAK_THRESHOLD_BREACHED, "error_rate"));
  assert(HasReason(rollout, v1::REASON_CODE_ROLLBACK_COMPLETED));
  assert(rollout.history(rollout.history_size() - 1).to_state() == v1::ROLLOUT_STATE_ROLLED_BACK);

  split = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(source) == 100);
  assert(split->WeightOf(target) == 0);
  assert(LifecycleOf(h, source) == v1::LIFECYCLE_STATE_SERVING);
  assert(WaitFor([&] { return LifecycleOf(h, target) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestAlertInterruptsSoak() {
  Harness    h;
  const auto source = DeployFirst(h);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "canary-alert", Millis(30000));
  request.mutable_strategy_params()->set_canary_percent(5);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_SOAKING));
  const auto target = h.Controller().Get(id).target_group_id();

  // alerts about other groups are not ours
  v1::MetricAlert unrelated;
  unrelated.set_service_name("checkout");
  unrelated.set_group_id(source + "-other");
  unrelated.set_metric("error_rate");
  unrelated.set_value(0.9);
  h.engine.sim.metrics->PushAlert(unrelated);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(h.Controller().Get(id).state() == v1::ROLLOUT_STATE_SOAKING);

  v1::MetricAlert alert;
  alert.set_service_name("checkout");
  alert.set_group_id(target);
  alert.set_metric("error_rate");
  alert.set_value(0.4);
  alert.set_message("5xx spike");
  h.engine.sim.metrics->PushAlert(alert);

  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));
  assert(HasReason(h.Controller().Get(id), v1::REASON_CODE_SOAK_ALERT, "5xx spike"));
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
}

v1::RolloutRequest RollingRequest(const std::string& key, v1::HaltPolicy policy) {
  auto request = Request("2.0.0", v1::STRATEGY_ROLLING, key, Millis(30));
  request.mutable_strategy_params()->set_batch_count(3);
  request.mutable_strategy_params()->set_halt_policy(policy);
  return request;
}

void TestRollingPromotesBatchByBatch() {
  Harness    h;
  const auto source = DeployFirst(h);

  const auto id = h.Controller().Submit(RollingRequest("rolling-clean", v1::HALT_POLICY_MANUAL)).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_PROMOTED));

  const auto rollout = h.Controller().Get(id);
  const auto target  = rollout.target_group_id();
  assert(CountReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED) == 3);
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "batch 1/3: target 1 replicas at 33%, source 2 replicas"));
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "batch 2/3: target 2 replicas at 67%, source 1 replicas"));
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "batch 3/3: target 3 replicas at 100%, source 0 replicas"));
  assert(!HasReason(rollout, v1::REASON_CODE_BATCH_HALTED));

  const auto split = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(target) == 100);
  assert(split->WeightOf(source) == 0);
  assert(h.engine.sim.scheduler->DesiredReplicas(target) == 3);
  assert(WaitFor([&] { return LifecycleOf(h, source) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestRollingHaltThenRetry() {
  Harness    h;
  const auto source = DeployFirst(h);

  // the new version breaks once it runs two or more replicas
  h.engine.sim.prober->FailWhenReplicasAtLeast("2.0.0", 2);

  const auto id = h.Controller().Submit(RollingRequest("rolling-retry", v1::HALT_POLICY_MANUAL)).rollout.id();
  assert(WaitFor([&] { return h.Controller().Get(id).halted(); }));

  auto rollout = h.Controller().Get(id);
  assert(rollout.state() == v1::ROLLOUT_STATE_SHIFTING);
  assert(HasReason(rollout, v1::REASON_CODE_BATCH_HALTED, "batch 2/3 failed health gate"));

  const auto target = rollout.target_group_id();
  const auto split  = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(target) == 33);
  assert(split->WeightOf(source) == 67);
  assert(h.engine.sim.scheduler->DesiredReplicas(source) == 2);
  assert(h.engine.sim.scheduler->DesiredReplicas(target) == 2);

  // stays parked until someone decides
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  assert(h.Controller().Get(id).halted());

  h.engine.sim.prober->FailWhenReplicasAtLeast("2.0.0", 100);
  h.Controller().ResolveHalt(id, v1::HALT_DECISION_RETRY_BATCH);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_PROMOTED));

  rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_BATCH_RETRY));
  assert(!rollout.halted());
  assert(h.engine.sim.scheduler->DesiredReplicas(target) == 3);
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(target) == 100);
}

void TestRollingHaltThenRollback() {
  Harness    h;
  const auto source = DeployFirst(h);
  h.engine.sim.prober->FailWhenReplicasAtLeast("2.0.0", 2);

  const auto id = h.Controller().Submit(RollingRequest("rolling-rollback", v1::HALT_POLICY_MANUAL)).rollout.id();
  assert(WaitFor([&] { return h.Controller().Get(id).halted(); }));

  h.Controller().ResolveHalt(id, v1::HALT_DECISION_ROLLBACK);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  assert(HasReason(h.Controller().Get(id), v1::REASON_CODE_BATCH_HALTED, "operator chose rollback"));
  assert(h.engine.sim.scheduler->DesiredReplicas(source) == 3);
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
}

void TestRollingHaltRollsBackByDefault() {
  Harness    h;
  const auto source = DeployFirst(h);
  h.engine.sim.prober->FailWhenReplicasAtLeast("2.0.0", 2);

  const auto id = h.Controller().Submit(RollingRequest("rolling-auto", v1::HALT_POLICY_ROLLBACK)).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_BATCH_HALTED, "batch 2/3"));
  assert(!rollout.halted());
  assert(h.engine.sim.scheduler->DesiredReplicas(source) == 3);
  assert(LifecycleOf(h, source) == v1::LIFECYCLE_STATE_SERVING);
}

void TestShadowPromotesWithoutMovingTraffic() {
  Harness    h;
  const auto source = DeployFirst(h);

  const auto id = h.Controller().Submit(Request("2.0.0", v1::STRATEGY_SHADOW, "shadow-ok", Millis(100))).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_PROMOTED));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_TRAFFIC_SHIFTED, "mirroring live traffic"));
  assert(h.engine.fleet->ServingGroup("checkout")->id() == source);

  const auto split = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(source) == 100);
  assert(split->mirrors.empty());
  assert(WaitFor([&] { return LifecycleOf(h, rollout.target_group_id()) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestShadowDivergenceRollsBack() {
  Harness    h;
  const auto source = DeployFirst(h);

  auto request = Request("2.0.0", v1::STRATEGY_SHADOW, "shadow-diverge", Millis(30000));
  request.mutable_strategy_params()->set_divergence_tolerance(0.1);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_SOAKING));
  const auto target = h.Controller().Get(id).target_group_id();
  assert(h.engine.splitter->GetWeights("checkout")->mirrors.count(target) == 1);

  h.engine.sim.metrics->SetGroupMetric(target, "latency_p99_ms", 200);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));
  assert(HasReason(h.Controller().Get(id), v1::REASON_CODE_SHADOW_DIVERGENCE, "latency_p99_ms"));

  const auto split = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(source) == 100);
  assert(split->mirrors.empty());
}

void TestSubmissionRules() {
  Harness h;

  const auto first = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "deploy-1"));
  const auto again = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "deploy-1"));
  assert(first.created);
  assert(!again.created);
  assert(again.rollout.id() == first.rollout.id());

  // same key, different request
  assert(Throws<rollout::util::InvalidArgument>(
      [&] { h.Controller().Submit(Request("2.0.0", v1::STRATEGY_BLUE_GREEN, "deploy-1")); }));

  assert(WaitForState(h, first.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));
  const auto replay = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "deploy-1"));
  assert(!replay.created);
  assert(replay.rollout.state() == v1::ROLLOUT_STATE_PROMOTED);

  // nothing new to deploy
  assert(Throws<rollout::util::InvalidArgument>(
      [&] { h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "deploy-1-again")); }));
  assert(Throws<rollout::util::NotFound>([&] { h.Controller().Submit(Request("9.9.9", v1::STRATEGY_BLUE_GREEN, "deploy-9")); }));

  auto other = Request("1.0.0", v1::STRATEGY_CANARY, "search-1");
  other.set_service_name("search");
  other.mutable_strategy_params()->set_canary_percent(10);
  // canary needs a serving version
  assert(Throws<rollout::util::InvalidArgument>([&] { h.Controller().Submit(other); }));

  auto slow = Request("2.0.0", v1::STRATEGY_CANARY, "deploy-2", Millis(30000));
  slow.mutable_strategy_params()->set_canary_percent(10);
  const auto second = h.Controller().Submit(slow);

  auto competing = Request("3.0.0", v1::STRATEGY_CANARY, "deploy-3");
  competing.mutable_strategy_params()->set_canary_percent(10);
  assert(Throws<rollout::util::Conflict>([&] { h.Controller().Submit(competing); }));

  assert(WaitForState(h, second.rollout.id(), v1::ROLLOUT_STATE_SOAKING));
  assert(Throws<rollout::util::InvalidState>(
      [&] { h.Controller().ResolveHalt(second.rollout.id(), v1::HALT_DECISION_RETRY_BATCH); }));
  assert(Throws<rollout::util::InvalidArgument>(
      [&] { h.Controller().ResolveHalt(second.rollout.id(), v1::HALT_DECISION_UNSPECIFIED); }));

  h.Controller().Abort(second.rollout.id(), "wrong build");
  assert(WaitForState(h, second.rollout.id(), v1::ROLLOUT_STATE_ROLLED_BACK));
  assert(HasReason(h.Controller().Get(second.rollout.id()), v1::REASON_CODE_OPERATOR_ABORTED, "wrong build"));
  assert(Throws<rollout::util::InvalidState>([&] { h.Controller().Abort(second.rollout.id(), "again"); }));

  assert(Throws<rollout::util::NotFound>([&] { h.Controller().Get("ro-missing"); }));

  const auto all = h.Controller().List("checkout", true);
  assert(all.size() == 2);
  assert(h.Controller().List("checkout", false).empty());
}

void TestFailedFirstDeployCarriesHistory() {
  Harness h;
  h.engine.sim.prober->SetVersionHealthy("1.0.0", false);

  const auto id = h.Controller().Submit(Request("1.0.0", v1::STRATEGY_BLUE_GREEN, "doomed")).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_FAILED));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_HEALTH_GATE_FAILED, "liveness"));
  assert(HasReason(rollout, v1::REASON_CODE_ROLLBACK_IMPOSSIBLE));
  assert(h.engine.splitter->GetWeights("checkout")->Sum() == 0);

  v1::RolloutEvent failed;
  assert(WaitFor([&] {
    for (const auto& event : h.engine.sim.events->Events()) {
      if (event.rollout_id() == id && event.transition().to_state() == v1::ROLLOUT_STATE_FAILED) {
        failed = event;
        return true;
      }
    }
    return false;
  }));
  assert(failed.history_size() == rollout.history_size());
  assert(failed.history(0).reason() == v1::REASON_CODE_ACCEPTED);
  assert(failed.history(failed.history_size() - 1).to_state() == v1::ROLLOUT_STATE_FAILED);

  assert(WaitFor([&] { return LifecycleOf(h, rollout.target_group_id()) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestProvisioningTimeoutRollsBack() {
  Harness    h;
  const auto source = DeployFirst(h);
  h.engine.sim.scheduler->HoldReadiness("2.0.0", true);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "stuck", Millis(30000));
  request.mutable_strategy_params()->set_canary_percent(10);
  *request.mutable_strategy_params()->mutable_provision_timeout() = rollout::util::ToProto(Millis(200));

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));
  assert(HasReason(h.Controller().Get(id), v1::REASON_CODE_PROVISIONING_TIMEOUT, "0/3 replicas ready"));
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
}

void TestRolloutTimeoutForcesRollback() {
  auto config = Config("ctl-a");
  *config.mutable_controller()->mutable_provision_timeout() = rollout::util::ToProto(Millis(1000));
  *config.mutable_controller()->mutable_rollout_timeout()   = rollout::util::ToProto(Millis(1500));

  Harness    h(config);
  const auto source = DeployFirst(h);

  // soaks far longer than the rollout may live
  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "slow-canary", Millis(60000));
  request.mutable_strategy_params()->set_canary_percent(10);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_ROLLOUT_TIMEOUT, "rollout exceeded 1500ms"));
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
  assert(WaitFor([&] { return LifecycleOf(h, rollout.target_group_id()) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestStandbyControllerResumesAbandonedRollout() {
  auto repository = std::make_shared<rollout::db::memory::MemoryRepository>();
  auto sim        = rollout::collab::sim::BuildSimEnvironment(Config("ctl-a").collaborators().simulation());

  Harness    first(repository, &sim, "ctl-a");
  const auto source = DeployFirst(first);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "handover", Millis(400));
  request.mutable_strategy_params()->set_canary_percent(25);
  *request.mutable_strategy_params()->mutable_step_soak_duration() = rollout::util::ToProto(Millis(30));

  const auto id = first.Controller().Submit(request).rollout.id();
  assert(WaitForState(first, id, v1::ROLLOUT_STATE_SOAKING));

  // crash: the lease stays behind until it expires
  first.Stop();

  Harness standby(repository, &sim, "ctl-b");
  assert(WaitForState(standby, id, v1::ROLLOUT_STATE_PROMOTED));

  const auto rollout = standby.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_LEASE_RECOVERED, "resumed by controller ctl-b"));
  assert(standby.engine.splitter->GetWeights("checkout")->WeightOf(rollout.target_group_id()) == 100);
  assert(WaitFor([&] { return LifecycleOf(standby, source) == v1::LIFECYCLE_STATE_TERMINATED; }));
}

void TestRevertReturnsToPreviousVersion() {
  Harness h;
  assert(Throws<rollout::util::InvalidState>([&] { h.Controller().Revert("checkout", ""); }));

  DeployFirst(h);
  const auto upgrade = h.Controller().Submit(Request("2.0.0", v1::STRATEGY_BLUE_GREEN, "upgrade"));
  assert(WaitForState(h, upgrade.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));

  const auto revert = h.Controller().Revert("checkout", "");
  assert(revert.created);
  assert(revert.rollout.request().target_artifact().version() == "1.0.0");
  assert(revert.rollout.request().strategy() == v1::STRATEGY_BLUE_GREEN);
  assert(WaitForState(h, revert.rollout.id(), v1::ROLLOUT_STATE_PROMOTED));

  assert(h.engine.fleet->ServingGroup("checkout")->artifact().version() == "1.0.0");
  assert(!h.Controller().Revert("checkout", "").rollout.id().empty());
}

void TestTargetKilledDuringSoakRollsBack() {
  Harness    h;
  const auto source = DeployFirst(h);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "canary-killed", Millis(30000));
  request.mutable_strategy_params()->set_canary_percent(10);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_SOAKING));
  const auto target = h.Controller().Get(id).target_group_id();
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(target) == 10);

  h.engine.sim.scheduler->Kill(target);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_UNEXPECTED_TERMINATION, target));
  assert(!HasReason(rollout, v1::REASON_CODE_PROMOTED));

  const auto split = h.engine.splitter->GetWeights("checkout");
  assert(split->WeightOf(source) == 100);
  assert(split->WeightOf(target) == 0);
  assert(LifecycleOf(h, source) == v1::LIFECYCLE_STATE_SERVING);
  assert(h.engine.fleet->ServingGroup("checkout")->id() == source);
}

void TestTargetKilledDuringProvisioningRollsBack() {
  Harness    h;
  const auto source = DeployFirst(h);
  h.engine.sim.scheduler->HoldReadiness("2.0.0", true);

  auto request = Request("2.0.0", v1::STRATEGY_CANARY, "provision-killed", Millis(30000));
  request.mutable_strategy_params()->set_canary_percent(10);

  const auto id = h.Controller().Submit(request).rollout.id();
  assert(WaitFor([&] {
    const auto rollout = h.Controller().Get(id);
    return rollout.state() == v1::ROLLOUT_STATE_PROVISIONING && !rollout.target_group_id().empty();
  }));
  const auto target = h.Controller().Get(id).target_group_id();

  h.engine.sim.scheduler->Kill(target);
  assert(WaitForState(h, id, v1::ROLLOUT_STATE_ROLLED_BACK));

  const auto rollout = h.Controller().Get(id);
  assert(HasReason(rollout, v1::REASON_CODE_UNEXPECTED_TERMINATION, "terminated by the cluster"));
  assert(!HasReason(rollout, v1::REASON_CODE_PROVISIONING_TIMEOUT));
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
  assert(LifecycleOf(h, source) == v1::LIFECYCLE_STATE_SERVING);
}

void TestTransientFailuresExhaustRetries() {
  Harness    h;
  const auto source = DeployFirst(h);

  // every create attempt fails
  h.engine.sim.scheduler->FailNextCalls(3);
  auto provisioning = Request("2.0.0", v1::STRATEGY_CANARY, "create-flaky", Millis(30000));
  provisioning.mutable_strategy_params()->set_canary_percent(10);

  const auto first = h.Controller().Submit(provisioning).rollout.id();
  assert(WaitForState(h, first, v1::ROLLOUT_STATE_ROLLED_BACK));
  auto rollout = h.Controller().Get(first);
  assert(HasReason(rollout, v1::REASON_CODE_TRANSIENT_EXHAUSTED, "scheduler.create failed after 3 attempts"));
  assert(rollout.target_group_id().empty());
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);

  // every status poll of one soak tick fails
  auto soaking = Request("3.0.0", v1::STRATEGY_CANARY, "status-flaky", Millis(30000));
  soaking.mutable_strategy_params()->set_canary_percent(10);

  const auto second = h.Controller().Submit(soaking).rollout.id();
  assert(WaitForState(h, second, v1::ROLLOUT_STATE_SOAKING));
  h.engine.sim.scheduler->FailNextCalls(3);
  assert(WaitForState(h, second, v1::ROLLOUT_STATE_ROLLED_BACK));

  rollout = h.Controller().Get(second);
  assert(HasReason(rollout, v1::REASON_CODE_TRANSIENT_EXHAUSTED, "scheduler.status failed after 3 attempts"));
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
  assert(LifecycleOf(h, source) == v1::LIFECYCLE_STATE_SERVING);
}

void TestSplitServiceRejectsNewRollout() {
  Harness    h;
  const auto source = DeployFirst(h);

  // what a rollback that could not restore its source leaves behind
  v1::InstanceGroup stray;
  stray.set_id("ig-stray");
  stray.set_service_name("checkout");
  stray.mutable_artifact()->set_name("checkout");
  stray.mutable_artifact()->set_version("2.0.0");
  stray.set_desired_replicas(3);
  h.engine.fleet->Register(stray);
  h.engine.fleet->SetWeights("checkout", {{source, 90}, {"ig-stray", 10}});
  assert(!h.engine.fleet->ServingGroup("checkout"));

  assert(Throws<rollout::util::InvalidArgument>(
      [&] { h.Controller().Submit(Request("3.0.0", v1::STRATEGY_BLUE_GREEN, "over-split")); }));
  assert(h.Controller().List("checkout", false).empty());
  assert(h.engine.splitter->GetWeights("checkout")->WeightOf(source) == 90);

  h.engine.fleet->SetWeights("checkout", {{source, 100}});
  const auto accepted = h.Controller().Submit(Request("3.0.0", v1::STRATEGY_BLUE_GREEN, "after-restore"));
  assert(accepted.created);
  assert(accepted.rollout.source_group_id() == source);
}

void TestResumedBatchWithUnknownTargetRollsBack() {
  auto repository = std::make_shared<rollout::db::memory::MemoryRepository>();
  auto sim        = rollout::collab::sim::BuildSimEnvironment(Config("ctl-a").collaborators().simulation());

  Harness    first(repository, &sim, "ctl-a");
  const auto source = DeployFirst(first);
  sim.prober->FailWhenReplicasAtLeast("2.0.0", 2);

  const auto id = first.Controller().Submit(RollingRequest("rolling-orphan", v1::HALT_POLICY_MANUAL)).rollout.id();
  assert(WaitFor([&] { return first.Controller().Get(id).halted(); }));
  first.Stop();

  // the stored batch points at a group no fleet ever recorded
  {
    auto tx     = repository->Begin();
    auto record = *repository->GetRollout(*tx, id);
    assert(record.body.batch_phase() == v1::BATCH_PHASE_VALIDATING);
    const auto expected = record.version;
    record.body.set_halted(false);
    record.body.set_target_group_id("ig-unrecorded");
    record.version = expected + 1;
    assert(repository->UpdateRollout(*tx, record, expected));
    tx->Commit();
  }

  Harness standby(repository, &sim, "ctl-b");
  assert(WaitForState(standby, id, v1::ROLLOUT_STATE_ROLLED_BACK));
  assert(HasReason(standby.Controller().Get(id), v1::REASON_CODE_UNEXPECTED_TERMINATION, "ig-unrecorded"));
  assert(standby.engine.splitter->GetWeights("checkout")->WeightOf(source) == 100);
  assert(sim.scheduler->DesiredReplicas(source) == 3);
}

} // namespace

int main() {
  TestBlueGreenFirstDeployPromotes();
  TestCanaryRampPromotesAndRetiresSource();
  TestCanaryRollsBackOnThresholdBreach();
  TestAlertInterruptsSoak();
  TestRollingPromotesBatchByBatch();
  TestRollingHaltThenRetry();
  TestRollingHaltThenRollback();
  TestRollingHaltRollsBackByDefault();
  TestShadowPromotesWithoutMovingTraffic();
  TestShadowDivergenceRollsBack();
  TestSubmissionRules();
  TestFailedFirstDeployCarriesHistory();
  TestProvisioningTimeoutRollsBack();
  TestRolloutTimeoutForcesRollback();
  TestStandbyControllerResumesAbandonedRollout();
  TestRevertReturnsToPreviousVersion();
  TestTargetKilledDuringSoakRollsBack();
  TestTargetKilledDuringProvisioningRollsBack();
  TestTransientFailuresExhaustRetries();
  TestSplitServiceRejectsNewRollout();
  TestResumedBatchWithUnknownTargetRollsBack();

  std::cout << "rollout_manager_unit_rollout_controller: pass\n";
  return 0;
}
