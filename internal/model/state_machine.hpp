#pragma once

#include <string_view>

#include "rollout/manager/core/v1/types.pb.h"

namespace rollout::model {

using rollout::manager::core::v1::LifecycleState;
using rollout::manager::core::v1::RolloutState;

namespace v1 = rollout::manager::core::v1;

constexpr bool IsTerminal(RolloutState state) {
  return state == v1::ROLLOUT_STATE_PROMOTED || state == v1::ROLLOUT_STATE_ROLLED_BACK || state == v1::ROLLOUT_STATE_FAILED;
}

/*
  Rollout transitions.

    PENDING -> PROVISIONING -> VALIDATING -> SHIFTING <-> SOAKING -> PROMOTED
    any non-terminal -> ROLLING_BACK -> ROLLED_BACK | FAILED

  Annotations (group created, batch halted, lease recovered) are written to
  history with from == to and do not go through CanTransition.
*/
constexpr bool CanTransition(RolloutState from, RolloutState to) {
  if (IsTerminal(from) || to == v1::ROLLOUT_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == v1::ROLLOUT_STATE_ROLLING_BACK) {
    return from != v1::ROLLOUT_STATE_ROLLING_BACK;
  }

  switch (from) {
    case v1::ROLLOUT_STATE_PENDING:
      return to == v1::ROLLOUT_STATE_PROVISIONING;
    case v1::ROLLOUT_STATE_PROVISIONING:
      return to == v1::ROLLOUT_STATE_VALIDATING;
    case v1::ROLLOUT_STATE_VALIDATING:
      return to == v1::ROLLOUT_STATE_SHIFTING;
    case v1::ROLLOUT_STATE_SHIFTING:
      return to == v1::ROLLOUT_STATE_SOAKING;
    case v1::ROLLOUT_STATE_SOAKING:
      return to == v1::ROLLOUT_STATE_SHIFTING || to == v1::ROLLOUT_STATE_PROMOTED;
    case v1::ROLLOUT_STATE_ROLLING_BACK:
      return to == v1::ROLLOUT_STATE_ROLLED_BACK || to == v1::ROLLOUT_STATE_FAILED;
    default:
      return false;
  }
}

constexpr bool IsTerminal(LifecycleState state) {
  return state == v1::LIFECYCLE_STATE_TERMINATED;
}

// Lifecycle is ordered by enum value; ABORTED sits just below TERMINATED so
// it can be entered from anywhere but never left except to TERMINATED.
constexpr bool CanTransition(LifecycleState from, LifecycleState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == v1::LIFECYCLE_STATE_UNSPECIFIED) {
    return false;
  }
  return static_cast<int>(to) > static_cast<int>(from);
}

// Groups in these states still count toward the service's traffic table.
constexpr bool IsLive(LifecycleState state) {
  return state != v1::LIFECYCLE_STATE_TERMINATED && state != v1::LIFECYCLE_STATE_UNSPECIFIED;
}

constexpr std::string_view ToString(RolloutState state) {
  switch (state) {
    case v1::ROLLOUT_STATE_PENDING:
      return "pending";
    case v1::ROLLOUT_STATE_PROVISIONING:
      return "provisioning";
    case v1::ROLLOUT_STATE_VALIDATING:
      return "validating";
    case v1::ROLLOUT_STATE_SHIFTING:
      return "shifting";
    case v1::ROLLOUT_STATE_SOAKING:
      return "soaking";
    case v1::ROLLOUT_STATE_PROMOTED:
      return "promoted";
    case v1::ROLLOUT_STATE_ROLLING_BACK:
      return "rolling_back";
    case v1::ROLLOUT_STATE_ROLLED_BACK:
      return "rolled_back";
    case v1::ROLLOUT_STATE_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(LifecycleState state) {
  switch (state) {
    case v1::LIFECYCLE_STATE_PROVISIONING:
      return "provisioning";
    case v1::LIFECYCLE_STATE_READY:
      return "ready";
    case v1::LIFECYCLE_STATE_VALIDATED:
      return "validated";
    case v1::LIFECYCLE_STATE_SERVING:
      return "serving";
    case v1::LIFECYCLE_STATE_RETIRING:
      return "retiring";
    case v1::LIFECYCLE_STATE_ABORTED:
      return "aborted";
    case v1::LIFECYCLE_STATE_TERMINATED:
      return "terminated";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(v1::Strategy strategy) {
  switch (strategy) {
    case v1::STRATEGY_BLUE_GREEN:
      return "blue_green";
    case v1::STRATEGY_CANARY:
      return "canary";
    case v1::STRATEGY_ROLLING:
      return "rolling";
    case v1::STRATEGY_SHADOW:
      return "shadow";
    default:
      return "unspecified";
  }
}

} // namespace rollout::model
