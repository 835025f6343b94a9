#pragma once

#include <stdexcept>
#include <string>

namespace rollout::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error.cpp)
  and, inside the controller, to rollout reason codes.
*/

// Rejected request: bad strategy params, unknown service, malformed ids.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another non-terminal rollout owns the service, or a versioned write lost a race.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient infrastructure failure; callers retry with backoff.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactInvalid : public std::runtime_error {
 public:
  explicit ArtifactInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The cluster reported a group as terminated while a rollout depended on it.
class UnexpectedTermination : public std::runtime_error {
 public:
  explicit UnexpectedTermination(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No healthy prior version exists; requires operator attention.
class IrrecoverableRollout : public std::runtime_error {
 public:
  explicit IrrecoverableRollout(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rollout::util
