#pragma once

#include "rollout/manager/v1.hpp"
#include "service_context.hpp"

namespace rollout::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  rollout::manager::v1::GetTrafficSplitResponse GetTrafficSplit(const rollout::manager::v1::GetTrafficSplitRequest& req);

  rollout::manager::v1::ListInstanceGroupsResponse ListInstanceGroups(const rollout::manager::v1::ListInstanceGroupsRequest& req);

  rollout::manager::v1::StatsResponse Stats(const rollout::manager::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rollout::service
