#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace rollout::lease {

// Exclusive right of one controller to drive rollouts for one service.
struct Lease {
  std::string service_name;
  std::string lease_id;
  std::string holder_id;
  uint64_t    fencing_token = 0;

  util::TimePoint expires_at;
};

} // namespace rollout::lease
