#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::strategy {

/*
  Strategy parameters, one alternative per deployment strategy. Built from
  a RolloutRequest by MakeStrategyPlan(), which rejects invalid parameters
  with util::InvalidArgument.
*/
struct BlueGreenPlan {
  util::Millis soak{0};
};

struct CanaryPlan {
  uint32_t              canary_percent = 0;
  std::vector<uint32_t> ramp;
  util::Millis          soak{0};
  util::Millis          step_soak{0};
};

struct RollingPlan {
  uint32_t                         target_replicas = 0;
  uint32_t                         source_replicas = 0;
  uint32_t                         batch_count     = 0;
  util::Millis                     soak{0};
  util::Millis                     step_soak{0};
  rollout::manager::v1::HaltPolicy halt_policy = rollout::manager::v1::HALT_POLICY_ROLLBACK;
};

struct ShadowPlan {
  util::Millis soak{0};
  double       divergence_tolerance = 0.0;
};

using StrategyPlan = std::variant<BlueGreenPlan, CanaryPlan, RollingPlan, ShadowPlan>;

enum class StepKind {
  kWeight,       // set target weight, remainder to source
  kReplicaBatch, // scale target up and source down, then weight by replica ratio
  kMirror,       // mirror live traffic to target, weight stays 0
};

struct PlanStep {
  StepKind     kind            = StepKind::kWeight;
  uint32_t     target_percent  = 0;
  uint32_t     target_replicas = 0;
  uint32_t     source_replicas = 0;
  util::Millis soak{0};
  bool         rerun_gate = false;
};

struct TrafficPlan {
  rollout::manager::v1::Strategy strategy = rollout::manager::v1::STRATEGY_UNSPECIFIED;
  std::vector<PlanStep>          steps;
  uint32_t                       initial_target_replicas = 0;
};

constexpr double kDefaultDivergenceTolerance = 0.1;

// Checks that need nothing but the request itself.
void ValidateRequest(const rollout::manager::v1::RolloutRequest& request);

/*
  target_replicas: replica count from the resolved artifact.
  source_replicas: desired replicas of the current serving group (0 if none).
*/
StrategyPlan MakeStrategyPlan(const rollout::manager::v1::RolloutRequest& request, uint32_t target_replicas, uint32_t source_replicas);

TrafficPlan Expand(const StrategyPlan& plan);

// Expand() plus the replica count the target group is created with.
TrafficPlan BuildTrafficPlan(const rollout::manager::v1::RolloutRequest& request, uint32_t target_replicas, uint32_t source_replicas);

// Replicas the target holds after batch `batch` (1-based) of `batch_count`.
uint32_t ReplicasAfterBatch(uint32_t total, uint32_t batch, uint32_t batch_count);

// Does the strategy put the target beside an existing serving group?
bool RequiresServingGroup(rollout::manager::v1::Strategy strategy);

} // namespace rollout::strategy
