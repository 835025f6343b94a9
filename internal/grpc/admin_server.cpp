#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace rollout::grpc {

using namespace rollout::manager::v1;

AdminServer::AdminServer(std::shared_ptr<rollout::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetTrafficSplit(::grpc::ServerContext*, const GetTrafficSplitRequest* req, GetTrafficSplitResponse* resp) {
  try {
    *resp = service_->GetTrafficSplit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListInstanceGroups(::grpc::ServerContext*, const ListInstanceGroupsRequest* req,
                                               ListInstanceGroupsResponse* resp) {
  try {
    *resp = service_->ListInstanceGroups(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rollout::grpc
