#pragma once

#include <cstdint>
#include <string>

#include "rollout/manager/core/v1/types.pb.h"

namespace rollout::db::model {

struct InstanceGroupRecord {
  std::string id;
  std::string service_name;

  rollout::manager::core::v1::LifecycleState lifecycle_state = rollout::manager::core::v1::LIFECYCLE_STATE_UNSPECIFIED;

  uint64_t updated_at_ms = 0;

  rollout::manager::core::v1::InstanceGroup body;
};

} // namespace rollout::db::model
