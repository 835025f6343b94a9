#include "client/cpp/rollout_client.h"

#include <grpcpp/client_context.h>

#include <chrono>
#include <thread>

namespace rollout::manager::client {

using namespace rollout::manager::v1;

namespace {

bool IsTerminal(RolloutState state) {
  return state == ROLLOUT_STATE_PROMOTED || state == ROLLOUT_STATE_ROLLED_BACK || state == ROLLOUT_STATE_FAILED;
}

} // namespace

RolloutClient::RolloutClient(std::shared_ptr<grpc::Channel> channel)
    : rollout_stub_(RolloutService::NewStub(channel)), admin_stub_(RolloutAdminService::NewStub(channel)) {
}

grpc::Status RolloutClient::Submit(const RolloutRequest& request, SubmitRolloutResponse* response) const {
  SubmitRolloutRequest req;
  *req.mutable_request() = request;

  grpc::ClientContext ctx;
  return rollout_stub_->SubmitRollout(&ctx, req, response);
}

grpc::Status RolloutClient::Get(const std::string& rollout_id, Rollout* rollout) const {
  GetRolloutRequest req;
  req.set_rollout_id(rollout_id);

  GetRolloutResponse  resp;
  grpc::ClientContext ctx;
  auto                status = rollout_stub_->GetRollout(&ctx, req, &resp);
  if (status.ok()) *rollout = resp.rollout();
  return status;
}

grpc::Status RolloutClient::Abort(const std::string& rollout_id, const std::string& reason, AbortRolloutResponse* response) const {
  AbortRolloutRequest req;
  req.set_rollout_id(rollout_id);
  req.set_reason(reason);

  grpc::ClientContext ctx;
  return rollout_stub_->AbortRollout(&ctx, req, response);
}

grpc::Status RolloutClient::List(const std::string& service_name, bool include_terminal, ListRolloutsResponse* response) const {
  ListRolloutsRequest req;
  req.set_service_name(service_name);
  req.set_include_terminal(include_terminal);

  grpc::ClientContext ctx;
  return rollout_stub_->ListRollouts(&ctx, req, response);
}

grpc::Status RolloutClient::ResolveHalt(const std::string& rollout_id, HaltDecision decision, ResolveHaltResponse* response) const {
  ResolveHaltRequest req;
  req.set_rollout_id(rollout_id);
  req.set_decision(decision);

  grpc::ClientContext ctx;
  return rollout_stub_->ResolveHalt(&ctx, req, response);
}

grpc::Status RolloutClient::Revert(const std::string& service_name, const std::string& idempotency_key,
                                   RevertServiceResponse* response) const {
  RevertServiceRequest req;
  req.set_service_name(service_name);
  req.set_idempotency_key(idempotency_key);

  grpc::ClientContext ctx;
  return rollout_stub_->RevertService(&ctx, req, response);
}

grpc::Status RolloutClient::GetTrafficSplit(const std::string& service_name, TrafficSplit* traffic) const {
  GetTrafficSplitRequest req;
  req.set_service_name(service_name);

  GetTrafficSplitResponse resp;
  grpc::ClientContext     ctx;
  auto                    status = admin_stub_->GetTrafficSplit(&ctx, req, &resp);
  if (status.ok()) *traffic = resp.traffic();
  return status;
}

grpc::Status RolloutClient::ListInstanceGroups(const std::string& service_name, bool include_terminated,
                                               ListInstanceGroupsResponse* response) const {
  ListInstanceGroupsRequest req;
  req.set_service_name(service_name);
  req.set_include_terminated(include_terminated);

  grpc::ClientContext ctx;
  return admin_stub_->ListInstanceGroups(&ctx, req, response);
}

grpc::Status RolloutClient::Stats(StatsResponse* response) const {
  grpc::ClientContext ctx;
  return admin_stub_->Stats(&ctx, StatsRequest(), response);
}

grpc::Status RolloutClient::WaitForTerminal(const std::string& rollout_id, uint64_t timeout_ms, Rollout* rollout) const {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    auto status = Get(rollout_id, rollout);
    if (!status.ok() || IsTerminal(rollout->state())) return status;
    if (std::chrono::steady_clock::now() >= deadline) {
      return {grpc::StatusCode::DEADLINE_EXCEEDED, "rollout " + rollout_id + " still " + RolloutState_Name(rollout->state())};
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  }
}

} // namespace rollout::manager::client
