#pragma once

#include <memory>
#include <string>
#include <vector>

#include "health_check.hpp"
#include "internal/runtime/task_queue.hpp"

namespace rollout::health {

enum class CheckOutcome {
  kPending,
  kPassed,
  kFailed,
  kTimeout,
  kSkipped,
  kCancelled,
};

std::string_view ToString(CheckOutcome outcome);

struct CheckResult {
  std::string  name;
  CheckOutcome outcome = CheckOutcome::kPending;
  std::string  diagnostic;
  util::Millis elapsed{0};
};

struct GateResult {
  bool                     passed = false;
  std::vector<CheckResult> results;

  // Every result that did not pass, in suite order.
  std::vector<CheckResult> Failures() const;

  // "name: OUTCOME (diagnostic); ..." over the failures.
  std::string Summary() const;
};

/*
  Runs a check suite against one group.

  Checks execute concurrently on the gate's worker queue; the queue's pool
  size bounds how many run at once across all gates. The first failure
  fails the gate: checks not yet started are marked SKIPPED while those in
  flight finish (bounded by their own timeout). The whole evaluation is
  bounded by the longest check timeout plus `grace`.
*/
class HealthGate {
 public:
  HealthGate(std::shared_ptr<runtime::TaskQueue> queue, util::Millis grace);

  // An empty suite passes. A fired `cancel` marks unfinished checks CANCELLED.
  GateResult Evaluate(const rollout::manager::v1::InstanceGroup& group, const CheckSuite& suite,
                      const util::CancelToken* cancel = nullptr) const;

 private:
  std::shared_ptr<runtime::TaskQueue> queue_;
  util::Millis                        grace_;
};

} // namespace rollout::health
