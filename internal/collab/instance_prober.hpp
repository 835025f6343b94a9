#pragma once

#include <memory>

#include "internal/util/cancel_token.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::collab {

// Sends probe traffic to an instance group on behalf of the built-in checks.
class InstanceProber {
 public:
  virtual ~InstanceProber() = default;

  // Implementations should return early once `cancel` fires.
  virtual rollout::manager::v1::ProbeResponse Probe(const rollout::manager::v1::InstanceGroup& group,
                                                    const rollout::manager::v1::ProbeRequest& request, const util::CancelToken& cancel) = 0;
};

using InstanceProberPtr = std::shared_ptr<InstanceProber>;

} // namespace rollout::collab
