#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/fleet/fleet_state_tracker.hpp"
#include "internal/traffic/traffic_splitter.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace rollout::service {

using namespace rollout::manager::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetTrafficSplitResponse AdminService::GetTrafficSplit(const GetTrafficSplitRequest& req) {
  return ObserveRpc("AdminService.GetTrafficSplit", req.service_name(), [&] {
    if (req.service_name().empty()) {
      throw rollout::util::InvalidArgument("service_name is required");
    }

    GetTrafficSplitResponse resp;
    *resp.mutable_traffic() = ctx_.splitter->GetWeights(req.service_name())->ToProto();
    return resp;
  });
}

ListInstanceGroupsResponse AdminService::ListInstanceGroups(const ListInstanceGroupsRequest& req) {
  return ObserveRpc("AdminService.ListInstanceGroups", req.service_name(), [&] {
    ListInstanceGroupsResponse resp;
    for (auto& group : ctx_.fleet->List(req.service_name(), req.include_terminated())) {
      *resp.add_groups() = std::move(group);
    }
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;

    auto tx = ctx_.repository->Begin();
    for (const auto& record : ctx_.repository->ListRollouts(*tx, "", true)) {
      switch (record.state) {
        case ROLLOUT_STATE_PROMOTED:
          resp.set_promoted_rollouts(resp.promoted_rollouts() + 1);
          break;
        case ROLLOUT_STATE_ROLLED_BACK:
          resp.set_rolled_back_rollouts(resp.rolled_back_rollouts() + 1);
          break;
        case ROLLOUT_STATE_FAILED:
          resp.set_failed_rollouts(resp.failed_rollouts() + 1);
          break;
        default:
          resp.set_active_rollouts(resp.active_rollouts() + 1);
          break;
      }
    }
    tx->Commit();

    resp.set_live_instance_groups(ctx_.fleet->List("", false).size());
    return resp;
  });
}

} // namespace rollout::service
