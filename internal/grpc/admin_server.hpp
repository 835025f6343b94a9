#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "rollout/manager/v1_grpc.hpp"

namespace rollout::grpc {

class AdminServer final : public rollout::manager::v1::RolloutAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<rollout::service::AdminService> svc);

  ::grpc::Status GetTrafficSplit(::grpc::ServerContext*, const rollout::manager::v1::GetTrafficSplitRequest*,
                                 rollout::manager::v1::GetTrafficSplitResponse*) override;

  ::grpc::Status ListInstanceGroups(::grpc::ServerContext*, const rollout::manager::v1::ListInstanceGroupsRequest*,
                                    rollout::manager::v1::ListInstanceGroupsResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const rollout::manager::v1::StatsRequest*, rollout::manager::v1::StatsResponse*) override;

 private:
  std::shared_ptr<rollout::service::AdminService> service_;
};

} // namespace rollout::grpc
