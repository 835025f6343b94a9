#pragma once

#include <cstdint>
#include <string>

#include "rollout/manager/core/v1/types.pb.h"

namespace rollout::db::model {

struct TrafficTableRecord {
  std::string service_name;
  uint64_t    version = 0;

  rollout::manager::core::v1::TrafficSplit body;
};

} // namespace rollout::db::model
