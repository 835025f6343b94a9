#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/rollout_service.hpp"
#include "rollout/manager/v1_grpc.hpp"

namespace rollout::grpc {

class RolloutServer final : public rollout::manager::v1::RolloutService::Service {
 public:
  explicit RolloutServer(std::shared_ptr<rollout::service::RolloutService> svc);

  ::grpc::Status SubmitRollout(::grpc::ServerContext*, const rollout::manager::v1::SubmitRolloutRequest*,
                               rollout::manager::v1::SubmitRolloutResponse*) override;

  ::grpc::Status GetRollout(::grpc::ServerContext*, const rollout::manager::v1::GetRolloutRequest*,
                            rollout::manager::v1::GetRolloutResponse*) override;

  ::grpc::Status AbortRollout(::grpc::ServerContext*, const rollout::manager::v1::AbortRolloutRequest*,
                              rollout::manager::v1::AbortRolloutResponse*) override;

  ::grpc::Status ListRollouts(::grpc::ServerContext*, const rollout::manager::v1::ListRolloutsRequest*,
                              rollout::manager::v1::ListRolloutsResponse*) override;

  ::grpc::Status ResolveHalt(::grpc::ServerContext*, const rollout::manager::v1::ResolveHaltRequest*,
                             rollout::manager::v1::ResolveHaltResponse*) override;

  ::grpc::Status RevertService(::grpc::ServerContext*, const rollout::manager::v1::RevertServiceRequest*,
                               rollout::manager::v1::RevertServiceResponse*) override;

 private:
  std::shared_ptr<rollout::service::RolloutService> service_;
};

} // namespace rollout::grpc
