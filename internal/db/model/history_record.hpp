#pragma once

#include <cstdint>
#include <string>

#include "rollout/manager/core/v1/types.pb.h"

namespace rollout::db::model {

// Append-only; (rollout_id, seq) is unique and rows are never updated.
struct HistoryRecord {
  std::string rollout_id;
  uint64_t    seq = 0;

  rollout::manager::core::v1::RolloutState from_state = rollout::manager::core::v1::ROLLOUT_STATE_UNSPECIFIED;
  rollout::manager::core::v1::RolloutState to_state   = rollout::manager::core::v1::ROLLOUT_STATE_UNSPECIFIED;
  rollout::manager::core::v1::ReasonCode   reason     = rollout::manager::core::v1::REASON_CODE_UNSPECIFIED;

  std::string diagnostic;
  uint64_t    at_ms = 0;
};

} // namespace rollout::db::model
