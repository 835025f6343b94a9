#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "rollout/manager/v1.hpp"

namespace {

namespace v1 = rollout::manager::v1;
namespace u  = rollout::util;

using rollout::grpc::ToStatus;

// Runs `fn` the way the servers do and returns the status a client would see.
template <typename Fn>
::grpc::Status Call(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

void TestErrorTypesMapToStatusCodes() {
  assert(ToStatus(u::InvalidArgument("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(u::ArtifactInvalid("no locator")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(u::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(u::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(u::Conflict("busy")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(u::LeaseConflict("held")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(u::InvalidState("terminal")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(u::IrrecoverableRollout("no source")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(u::Unavailable("down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(u::DeadlineExceeded("slow")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(u::NotFound("rollout not found: ro-1"));
  assert(status.error_message() == "rollout not found: ro-1");
}

void TestServiceErrorsReachTheClientAsStatuses() {
  const auto config = rollout::config::ConfigLoader::LoadFromYamlString("controller:\n  controller_id: \"ctl-status\"\n");

  auto engine = rollout::factory::Build(config, std::make_shared<rollout::db::memory::MemoryRepository>());
  engine.Start();

  v1::GetRolloutRequest missing_id;
  assert(Call([&] { engine.rollout_service->Get(missing_id); }).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::GetRolloutRequest unknown;
  unknown.set_rollout_id("ro-unknown");
  assert(Call([&] { engine.rollout_service->Get(unknown); }).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::RevertServiceRequest revert;
  revert.set_service_name("checkout");
  assert(Call([&] { engine.rollout_service->Revert(revert); }).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  v1::SubmitRolloutRequest submit;
  submit.mutable_request()->set_service_name("checkout");
  submit.mutable_request()->mutable_target_artifact()->set_name("checkout");
  submit.mutable_request()->mutable_target_artifact()->set_version("1.0.0");
  submit.mutable_request()->set_strategy(v1::STRATEGY_BLUE_GREEN);
  submit.mutable_request()->set_idempotency_key("status-1");
  // the registry is empty
  assert(Call([&] { engine.rollout_service->Submit(submit); }).error_code() == ::grpc::StatusCode::NOT_FOUND);

  engine.Stop();
}

} // namespace

int main() {
  TestErrorTypesMapToStatusCodes();
  TestServiceErrorsReachTheClientAsStatuses();

  std::cout << "rollout_manager_unit_grpc_status: pass\n";
  return 0;
}
