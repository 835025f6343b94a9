#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/util/cancel_token.hpp"
#include "internal/util/time.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::health {

struct CheckVerdict {
  bool        passed = false;
  std::string diagnostic;

  static CheckVerdict Pass() {
    return {true, {}};
  }

  static CheckVerdict Fail(std::string diagnostic) {
    return {false, std::move(diagnostic)};
  }
};

/*
  A single named probe against an instance group.

  Run() executes on a health-gate worker. It should return promptly once
  `cancel` fires (the gate cancels it on timeout); exceptions are reported
  as a failed verdict.
*/
class HealthCheck {
 public:
  virtual ~HealthCheck() = default;

  virtual const std::string& Name() const = 0;

  virtual util::Millis Timeout() const = 0;

  virtual CheckVerdict Run(const rollout::manager::v1::InstanceGroup& group, const util::CancelToken& cancel) = 0;
};

using HealthCheckPtr = std::shared_ptr<HealthCheck>;
using CheckSuite     = std::vector<HealthCheckPtr>;

} // namespace rollout::health
