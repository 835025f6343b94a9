#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace rollout::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace rollout::util;

  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const ArtifactInvalid*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e) || dynamic_cast<const LeaseConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const IrrecoverableRollout*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace rollout::grpc
