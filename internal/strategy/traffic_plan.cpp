#include "traffic_plan.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace rollout::strategy {

namespace v1 = rollout::manager::v1;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void RequireNonNegative(const google::protobuf::Duration& d, const char* field) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw util::InvalidArgument(std::string(field) + " must not be negative");
  }
}

uint32_t RatioPercent(uint32_t target, uint32_t source) {
  if (source == 0) return 100;
  return static_cast<uint32_t>(std::lround(100.0 * target / static_cast<double>(target + source)));
}

} // namespace

bool RequiresServingGroup(v1::Strategy strategy) {
  return strategy == v1::STRATEGY_CANARY || strategy == v1::STRATEGY_ROLLING || strategy == v1::STRATEGY_SHADOW;
}

uint32_t ReplicasAfterBatch(uint32_t total, uint32_t batch, uint32_t batch_count) {
  if (batch_count == 0) return total;
  return static_cast<uint32_t>((static_cast<uint64_t>(batch) * total + batch_count - 1) / batch_count);
}

void ValidateRequest(const v1::RolloutRequest& request) {
  if (request.service_name().empty()) {
    throw util::InvalidArgument("service_name is required");
  }
  if (request.target_artifact().name().empty() || request.target_artifact().version().empty()) {
    throw util::InvalidArgument("target_artifact name and version are required");
  }
  if (request.idempotency_key().empty()) {
    throw util::InvalidArgument("idempotency_key is required");
  }

  const auto& params = request.strategy_params();
  RequireNonNegative(params.soak_duration(), "soak_duration");
  RequireNonNegative(params.step_soak_duration(), "step_soak_duration");
  RequireNonNegative(params.tick_interval(), "tick_interval");
  RequireNonNegative(params.provision_timeout(), "provision_timeout");

  for (const auto& threshold : params.thresholds()) {
    if (threshold.metric().empty()) {
      throw util::InvalidArgument("every threshold needs a metric name");
    }
  }

  switch (request.strategy()) {
    case v1::STRATEGY_BLUE_GREEN:
      break;

    case v1::STRATEGY_CANARY: {
      const auto canary = params.canary_percent();
      if (canary < 1 || canary > 99) {
        throw util::InvalidArgument("canary_percent must be within [1, 99], got " + std::to_string(canary));
      }
      uint32_t previous = canary;
      for (const auto step : params.ramp_steps()) {
        if (step <= previous || step > 100) {
          throw util::InvalidArgument("ramp_steps must strictly increase from canary_percent up to 100");
        }
        previous = step;
      }
      if (!params.ramp_steps().empty() && previous != 100) {
        throw util::InvalidArgument("ramp_steps must end at 100");
      }
      break;
    }

    case v1::STRATEGY_ROLLING:
      if (params.batch_count() == 0) {
        throw util::InvalidArgument("batch_count must be at least 1");
      }
      break;

    case v1::STRATEGY_SHADOW:
      if (params.divergence_tolerance() < 0.0 || !std::isfinite(params.divergence_tolerance())) {
        throw util::InvalidArgument("divergence_tolerance must be a non-negative number");
      }
      break;

    default:
      throw util::InvalidArgument("strategy is required");
  }
}

StrategyPlan MakeStrategyPlan(const v1::RolloutRequest& request, uint32_t target_replicas, uint32_t source_replicas) {
  ValidateRequest(request);

  const auto& params = request.strategy_params();
  const auto  soak   = util::FromProto(params.soak_duration());

  switch (request.strategy()) {
    case v1::STRATEGY_CANARY: {
      CanaryPlan plan;
      plan.canary_percent = params.canary_percent();
      plan.ramp.assign(params.ramp_steps().begin(), params.ramp_steps().end());
      if (plan.ramp.empty()) plan.ramp.push_back(100);
      plan.soak      = soak;
      plan.step_soak = util::OrDefault(params.step_soak_duration(), soak);
      return plan;
    }

    case v1::STRATEGY_ROLLING: {
      if (params.batch_count() > target_replicas) {
        throw util::InvalidArgument("batch_count " + std::to_string(params.batch_count()) + " exceeds the artifact's " +
                                    std::to_string(target_replicas) + " replicas");
      }
      RollingPlan plan;
      plan.target_replicas = target_replicas;
      plan.source_replicas = source_replicas;
      plan.batch_count     = params.batch_count();
      plan.soak            = soak;
      plan.step_soak       = util::FromProto(params.step_soak_duration());
      plan.halt_policy     = params.halt_policy();
      return plan;
    }

    case v1::STRATEGY_SHADOW: {
      ShadowPlan plan;
      plan.soak                 = soak;
      plan.divergence_tolerance = params.divergence_tolerance() > 0.0 ? params.divergence_tolerance() : kDefaultDivergenceTolerance;
      return plan;
    }

    default:
      return BlueGreenPlan{soak};
  }
}

TrafficPlan Expand(const StrategyPlan& plan) {
  return std::visit(Overloaded{
                        [](const BlueGreenPlan& p) {
                          TrafficPlan out;
                          out.strategy = v1::STRATEGY_BLUE_GREEN;
                          out.steps.push_back(PlanStep{StepKind::kWeight, 100, 0, 0, p.soak, false});
                          return out;
                        },
                        [](const CanaryPlan& p) {
                          TrafficPlan out;
                          out.strategy = v1::STRATEGY_CANARY;
                          out.steps.push_back(PlanStep{StepKind::kWeight, p.canary_percent, 0, 0, p.soak, false});
                          for (const auto percent : p.ramp) {
                            out.steps.push_back(PlanStep{StepKind::kWeight, percent, 0, 0, p.step_soak, false});
                          }
                          return out;
                        },
                        [](const RollingPlan& p) {
                          TrafficPlan out;
                          out.strategy = v1::STRATEGY_ROLLING;
                          for (uint32_t batch = 1; batch <= p.batch_count; ++batch) {
                            PlanStep step;
                            step.kind            = StepKind::kReplicaBatch;
                            step.target_replicas = ReplicasAfterBatch(p.target_replicas, batch, p.batch_count);
                            step.source_replicas = p.source_replicas - ReplicasAfterBatch(p.source_replicas, batch, p.batch_count);
                            step.target_percent  = batch == p.batch_count ? 100 : RatioPercent(step.target_replicas, step.source_replicas);
                            step.soak            = batch == p.batch_count ? p.soak : p.step_soak;
                            // the first batch was validated while the rollout sat in VALIDATING
                            step.rerun_gate = batch > 1;
                            out.steps.push_back(step);
                          }
                          return out;
                        },
                        [](const ShadowPlan& p) {
                          TrafficPlan out;
                          out.strategy = v1::STRATEGY_SHADOW;
                          out.steps.push_back(PlanStep{StepKind::kMirror, 0, 0, 0, p.soak, false});
                          return out;
                        },
                    },
                    plan);
}

TrafficPlan BuildTrafficPlan(const v1::RolloutRequest& request, uint32_t target_replicas, uint32_t source_replicas) {
  auto plan = Expand(MakeStrategyPlan(request, target_replicas, source_replicas));
  plan.initial_target_replicas =
      plan.strategy == v1::STRATEGY_ROLLING && !plan.steps.empty() ? plan.steps.front().target_replicas : target_replicas;
  return plan;
}

} // namespace rollout::strategy
