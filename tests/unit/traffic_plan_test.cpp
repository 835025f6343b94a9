#include "internal/strategy/traffic_plan.hpp"

#include <cassert>
#include <iostream>
#include <variant>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = rollout::manager::v1;

using rollout::strategy::BuildTrafficPlan;
using rollout::strategy::StepKind;
using rollout::util::Millis;

v1::RolloutRequest Request(v1::Strategy strategy) {
  v1::RolloutRequest request;
  request.set_service_name("checkout");
  request.mutable_target_artifact()->set_name("checkout");
  request.mutable_target_artifact()->set_version("2.0.0");
  request.set_strategy(strategy);
  request.set_idempotency_key("key-1");
  request.mutable_strategy_params()->mutable_soak_duration()->set_seconds(60);
  return request;
}

bool Rejected(const v1::RolloutRequest& request, uint32_t target_replicas = 3, uint32_t source_replicas = 3) {
  try {
    (void)BuildTrafficPlan(request, target_replicas, source_replicas);
  } catch (const rollout::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestBlueGreenIsOneFullCutover() {
  const auto plan = BuildTrafficPlan(Request(v1::STRATEGY_BLUE_GREEN), 4, 0);
  assert(plan.steps.size() == 1);
  assert(plan.steps[0].kind == StepKind::kWeight);
  assert(plan.steps[0].target_percent == 100);
  assert(plan.steps[0].soak == Millis(60000));
  assert(plan.initial_target_replicas == 4);
}

void TestCanaryRampsThroughSteps() {
  auto request = Request(v1::STRATEGY_CANARY);
  auto params  = request.mutable_strategy_params();
  params->set_canary_percent(5);
  params->add_ramp_steps(25);
  params->add_ramp_steps(50);
  params->add_ramp_steps(100);
  params->mutable_step_soak_duration()->set_seconds(10);

  const auto plan = BuildTrafficPlan(request, 3, 3);
  assert(plan.steps.size() == 4);
  assert(plan.steps[0].target_percent == 5);
  assert(plan.steps[0].soak == Millis(60000));
  assert(plan.steps[1].target_percent == 25);
  assert(plan.steps[1].soak == Millis(10000));
  assert(plan.steps[3].target_percent == 100);
}

void TestCanaryWithoutRampGoesStraightToFull() {
  auto request = Request(v1::STRATEGY_CANARY);
  request.mutable_strategy_params()->set_canary_percent(10);

  const auto plan = BuildTrafficPlan(request, 3, 3);
  assert(plan.steps.size() == 2);
  assert(plan.steps[1].target_percent == 100);
  // step soak falls back to the soak duration
  assert(plan.steps[1].soak == Millis(60000));
}

void TestCanaryParameterValidation() {
  auto zero = Request(v1::STRATEGY_CANARY);
  assert(Rejected(zero));

  auto full = Request(v1::STRATEGY_CANARY);
  full.mutable_strategy_params()->set_canary_percent(100);
  assert(Rejected(full));

  auto decreasing = Request(v1::STRATEGY_CANARY);
  decreasing.mutable_strategy_params()->set_canary_percent(20);
  decreasing.mutable_strategy_params()->add_ramp_steps(10);
  decreasing.mutable_strategy_params()->add_ramp_steps(100);
  assert(Rejected(decreasing));

  auto short_of_full = Request(v1::STRATEGY_CANARY);
  short_of_full.mutable_strategy_params()->set_canary_percent(20);
  short_of_full.mutable_strategy_params()->add_ramp_steps(50);
  assert(Rejected(short_of_full));
}

void TestRollingBatchesMoveReplicas() {
  auto request = Request(v1::STRATEGY_ROLLING);
  request.mutable_strategy_params()->set_batch_count(3);

  const auto plan = BuildTrafficPlan(request, 3, 3);
  assert(plan.steps.size() == 3);
  assert(plan.initial_target_replicas == 1);

  assert(plan.steps[0].kind == StepKind::kReplicaBatch);
  assert(plan.steps[0].target_replicas == 1 && plan.steps[0].source_replicas == 2);
  assert(plan.steps[0].target_percent == 33);
  assert(!plan.steps[0].rerun_gate);

  assert(plan.steps[1].target_replicas == 2 && plan.steps[1].source_replicas == 1);
  assert(plan.steps[1].target_percent == 67);
  assert(plan.steps[1].rerun_gate);

  assert(plan.steps[2].target_replicas == 3 && plan.steps[2].source_replicas == 0);
  assert(plan.steps[2].target_percent == 100);
  assert(plan.steps[2].soak == Millis(60000));
}

void TestRollingRejectsMoreBatchesThanReplicas() {
  auto request = Request(v1::STRATEGY_ROLLING);
  request.mutable_strategy_params()->set_batch_count(5);
  assert(Rejected(request, 3, 3));

  request.mutable_strategy_params()->set_batch_count(0);
  assert(Rejected(request, 3, 3));
}

void TestShadowMirrorsWithDefaultTolerance() {
  auto       request = Request(v1::STRATEGY_SHADOW);
  const auto plan    = BuildTrafficPlan(request, 2, 2);
  assert(plan.steps.size() == 1);
  assert(plan.steps[0].kind == StepKind::kMirror);
  assert(plan.steps[0].target_percent == 0);

  const auto strategy = rollout::strategy::MakeStrategyPlan(request, 2, 2);
  assert(std::get<rollout::strategy::ShadowPlan>(strategy).divergence_tolerance == rollout::strategy::kDefaultDivergenceTolerance);

  request.mutable_strategy_params()->set_divergence_tolerance(-1.0);
  assert(Rejected(request));
}

void TestRequestLevelValidation() {
  auto no_key = Request(v1::STRATEGY_BLUE_GREEN);
  no_key.clear_idempotency_key();
  assert(Rejected(no_key));

  auto no_strategy = Request(v1::STRATEGY_UNSPECIFIED);
  assert(Rejected(no_strategy));

  auto negative = Request(v1::STRATEGY_BLUE_GREEN);
  negative.mutable_strategy_params()->mutable_soak_duration()->set_seconds(-1);
  assert(Rejected(negative));

  auto unnamed = Request(v1::STRATEGY_BLUE_GREEN);
  unnamed.mutable_strategy_params()->add_thresholds()->set_limit(1.0);
  assert(Rejected(unnamed));

  assert(rollout::strategy::RequiresServingGroup(v1::STRATEGY_CANARY));
  assert(!rollout::strategy::RequiresServingGroup(v1::STRATEGY_BLUE_GREEN));
}

} // namespace

int main() {
  TestBlueGreenIsOneFullCutover();
  TestCanaryRampsThroughSteps();
  TestCanaryWithoutRampGoesStraightToFull();
  TestCanaryParameterValidation();
  TestRollingBatchesMoveReplicas();
  TestRollingRejectsMoreBatchesThanReplicas();
  TestShadowMirrorsWithDefaultTolerance();
  TestRequestLevelValidation();

  std::cout << "rollout_manager_unit_traffic_plan: pass\n";
  return 0;
}
