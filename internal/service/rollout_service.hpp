#pragma once

#include "rollout/manager/v1.hpp"
#include "service_context.hpp"

namespace rollout::service {

class RolloutService {
 public:
  explicit RolloutService(ServiceContext ctx);

  rollout::manager::v1::SubmitRolloutResponse Submit(const rollout::manager::v1::SubmitRolloutRequest& req);

  rollout::manager::v1::GetRolloutResponse Get(const rollout::manager::v1::GetRolloutRequest& req);

  rollout::manager::v1::AbortRolloutResponse Abort(const rollout::manager::v1::AbortRolloutRequest& req);

  rollout::manager::v1::ListRolloutsResponse List(const rollout::manager::v1::ListRolloutsRequest& req);

  rollout::manager::v1::ResolveHaltResponse ResolveHalt(const rollout::manager::v1::ResolveHaltRequest& req);

  rollout::manager::v1::RevertServiceResponse Revert(const rollout::manager::v1::RevertServiceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rollout::service
