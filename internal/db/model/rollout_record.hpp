#pragma once

#include <cstdint>
#include <string>

#include "rollout/manager/core/v1/types.pb.h"

namespace rollout::db::model {

/*
  Persistent rollout row.

  - Indexed columns are duplicated out of `body` so backends can filter
    without decoding.
  - `body` never carries history (rollout_history is the audit log) or the
    traffic snapshot (filled on read).
  - Version is the optimistic concurrency token; every update must present
    the version it read.
*/
struct RolloutRecord {
  std::string id;
  std::string service_name;
  std::string idempotency_key;

  rollout::manager::core::v1::RolloutState state = rollout::manager::core::v1::ROLLOUT_STATE_UNSPECIFIED;
  bool terminal = false;

  uint64_t version       = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  rollout::manager::core::v1::Rollout body;
};

} // namespace rollout::db::model
