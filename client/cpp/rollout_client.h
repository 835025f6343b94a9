#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <memory>
#include <string>

#include "rollout/manager/v1_grpc.hpp"

namespace rollout::manager::client {

/*
  Thin synchronous wrapper over the RolloutService and RolloutAdminService
  stubs. Every call returns the RPC status; the response is only valid
  when the status is OK.
*/
class RolloutClient {
 public:
  explicit RolloutClient(std::shared_ptr<grpc::Channel> channel);

  grpc::Status Submit(const rollout::manager::v1::RolloutRequest& request, rollout::manager::v1::SubmitRolloutResponse* response) const;

  grpc::Status Get(const std::string& rollout_id, rollout::manager::v1::Rollout* rollout) const;

  grpc::Status Abort(const std::string& rollout_id, const std::string& reason,
                     rollout::manager::v1::AbortRolloutResponse* response) const;

  grpc::Status List(const std::string& service_name, bool include_terminal, rollout::manager::v1::ListRolloutsResponse* response) const;

  grpc::Status ResolveHalt(const std::string& rollout_id, rollout::manager::v1::HaltDecision decision,
                           rollout::manager::v1::ResolveHaltResponse* response) const;

  grpc::Status Revert(const std::string& service_name, const std::string& idempotency_key,
                      rollout::manager::v1::RevertServiceResponse* response) const;

  grpc::Status GetTrafficSplit(const std::string& service_name, rollout::manager::v1::TrafficSplit* traffic) const;

  grpc::Status ListInstanceGroups(const std::string& service_name, bool include_terminated,
                                  rollout::manager::v1::ListInstanceGroupsResponse* response) const;

  grpc::Status Stats(rollout::manager::v1::StatsResponse* response) const;

  // Polls Get until the rollout is terminal or `timeout_ms` elapses.
  grpc::Status WaitForTerminal(const std::string& rollout_id, uint64_t timeout_ms, rollout::manager::v1::Rollout* rollout) const;

 private:
  std::unique_ptr<rollout::manager::v1::RolloutService::Stub>      rollout_stub_;
  std::unique_ptr<rollout::manager::v1::RolloutAdminService::Stub> admin_stub_;
};

} // namespace rollout::manager::client
