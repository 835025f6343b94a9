#include "rollout_service.hpp"

#include "internal/core/rollout_controller.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace rollout::service {

using namespace rollout::manager::v1;

namespace {

void RequireRolloutId(const std::string& id) {
  if (id.empty()) {
    throw rollout::util::InvalidArgument("rollout_id is required");
  }
}

SubmitDisposition Disposition(bool created) {
  return created ? SUBMIT_DISPOSITION_ACCEPTED : SUBMIT_DISPOSITION_REPLAYED;
}

} // namespace

RolloutService::RolloutService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitRolloutResponse RolloutService::Submit(const SubmitRolloutRequest& req) {
  return ObserveRpc("RolloutService.Submit", req.request().service_name(), [&] {
    if (!req.has_request()) {
      throw rollout::util::InvalidArgument("request is required");
    }

    const auto result = ctx_.controller->Submit(req.request());

    SubmitRolloutResponse resp;
    resp.set_rollout_id(result.rollout.id());
    resp.set_disposition(Disposition(result.created));
    resp.set_state(result.rollout.state());
    return resp;
  });
}

GetRolloutResponse RolloutService::Get(const GetRolloutRequest& req) {
  return ObserveRpc("RolloutService.Get", req.rollout_id(), [&] {
    RequireRolloutId(req.rollout_id());

    GetRolloutResponse resp;
    *resp.mutable_rollout() = ctx_.controller->Get(req.rollout_id());
    return resp;
  });
}

AbortRolloutResponse RolloutService::Abort(const AbortRolloutRequest& req) {
  return ObserveRpc("RolloutService.Abort", req.rollout_id(), [&] {
    RequireRolloutId(req.rollout_id());

    const auto rollout = ctx_.controller->Abort(req.rollout_id(), req.reason());

    AbortRolloutResponse resp;
    resp.set_acknowledged(true);
    resp.set_state(rollout.state());
    return resp;
  });
}

ListRolloutsResponse RolloutService::List(const ListRolloutsRequest& req) {
  return ObserveRpc("RolloutService.List", req.service_name(), [&] {
    ListRolloutsResponse resp;
    for (auto& rollout : ctx_.controller->List(req.service_name(), req.include_terminal())) {
      *resp.add_rollouts() = std::move(rollout);
    }
    return resp;
  });
}

ResolveHaltResponse RolloutService::ResolveHalt(const ResolveHaltRequest& req) {
  return ObserveRpc("RolloutService.ResolveHalt", req.rollout_id(), [&] {
    RequireRolloutId(req.rollout_id());

    ResolveHaltResponse resp;
    resp.set_state(ctx_.controller->ResolveHalt(req.rollout_id(), req.decision()).state());
    return resp;
  });
}

RevertServiceResponse RolloutService::Revert(const RevertServiceRequest& req) {
  return ObserveRpc("RolloutService.Revert", req.service_name(), [&] {
    if (req.service_name().empty()) {
      throw rollout::util::InvalidArgument("service_name is required");
    }

    const auto result = ctx_.controller->Revert(req.service_name(), req.idempotency_key());

    RevertServiceResponse resp;
    resp.set_rollout_id(result.rollout.id());
    resp.set_disposition(Disposition(result.created));
    *resp.mutable_artifact() = result.rollout.artifact();
    return resp;
  });
}

} // namespace rollout::service
