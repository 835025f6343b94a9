#include "rollout_server.hpp"

#include "grpc_error.hpp"

namespace rollout::grpc {

using namespace rollout::manager::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

RolloutServer::RolloutServer(std::shared_ptr<rollout::service::RolloutService> svc) : service_(std::move(svc)) {
}

::grpc::Status RolloutServer::SubmitRollout(::grpc::ServerContext*, const SubmitRolloutRequest* req, SubmitRolloutResponse* resp) {
  return Invoke([&] { *resp = service_->Submit(*req); });
}

::grpc::Status RolloutServer::GetRollout(::grpc::ServerContext*, const GetRolloutRequest* req, GetRolloutResponse* resp) {
  return Invoke([&] { *resp = service_->Get(*req); });
}

::grpc::Status RolloutServer::AbortRollout(::grpc::ServerContext*, const AbortRolloutRequest* req, AbortRolloutResponse* resp) {
  return Invoke([&] { *resp = service_->Abort(*req); });
}

::grpc::Status RolloutServer::ListRollouts(::grpc::ServerContext*, const ListRolloutsRequest* req, ListRolloutsResponse* resp) {
  return Invoke([&] { *resp = service_->List(*req); });
}

::grpc::Status RolloutServer::ResolveHalt(::grpc::ServerContext*, const ResolveHaltRequest* req, ResolveHaltResponse* resp) {
  return Invoke([&] { *resp = service_->ResolveHalt(*req); });
}

::grpc::Status RolloutServer::RevertService(::grpc::ServerContext*, const RevertServiceRequest* req, RevertServiceResponse* resp) {
  return Invoke([&] { *resp = service_->Revert(*req); });
}

} // namespace rollout::grpc
