#include "health_gate.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace rollout::health {

namespace {

constexpr util::Millis kCancelPollInterval{25};

struct Slot {
  CheckResult                        result;
  bool                               started = false;
  util::SteadyClock::time_point      started_at{};
  std::shared_ptr<util::CancelToken> cancel = std::make_shared<util::CancelToken>();
};

// Shared with worker tasks that may outlive Evaluate().
struct Evaluation {
  std::mutex              mutex;
  std::condition_variable cv;
  std::vector<Slot>       slots;
  std::size_t             finished = 0;
  bool                    failed   = false;

  // Caller holds mutex.
  void Finish(Slot& slot, CheckOutcome outcome, std::string diagnostic, util::Millis elapsed) {
    slot.result.outcome    = outcome;
    slot.result.diagnostic = std::move(diagnostic);
    slot.result.elapsed    = elapsed;
    ++finished;
    if (outcome != CheckOutcome::kPassed) failed = true;
  }

  // Caller holds mutex.
  void SkipUnstarted(std::string_view why) {
    for (auto& slot : slots) {
      if (!slot.started && slot.result.outcome == CheckOutcome::kPending) {
        Finish(slot, CheckOutcome::kSkipped, std::string(why), util::Millis(0));
      }
    }
  }
};

util::Millis Since(util::SteadyClock::time_point start) {
  return std::chrono::duration_cast<util::Millis>(util::SteadyClock::now() - start);
}

} // namespace

std::string_view ToString(CheckOutcome outcome) {
  switch (outcome) {
    case CheckOutcome::kPassed:
      return "PASSED";
    case CheckOutcome::kFailed:
      return "FAILED";
    case CheckOutcome::kTimeout:
      return "TIMEOUT";
    case CheckOutcome::kSkipped:
      return "SKIPPED";
    case CheckOutcome::kCancelled:
      return "CANCELLED";
    default:
      return "PENDING";
  }
}

std::vector<CheckResult> GateResult::Failures() const {
  std::vector<CheckResult> out;
  for (const auto& result : results) {
    if (result.outcome != CheckOutcome::kPassed) out.push_back(result);
  }
  return out;
}

std::string GateResult::Summary() const {
  std::string out;
  for (const auto& failure : Failures()) {
    if (!out.empty()) out += "; ";
    out += failure.name + ": " + std::string(ToString(failure.outcome));
    if (!failure.diagnostic.empty()) out += " (" + failure.diagnostic + ")";
  }
  return out;
}

HealthGate::HealthGate(std::shared_ptr<runtime::TaskQueue> queue, util::Millis grace) : queue_(std::move(queue)), grace_(grace) {
}

GateResult HealthGate::Evaluate(const rollout::manager::v1::InstanceGroup& group, const CheckSuite& suite,
                                const util::CancelToken* cancel) const {
  GateResult gate;
  if (suite.empty()) {
    gate.passed = true;
    return gate;
  }

  observability::SpanScope span("health_gate.evaluate");
  span.SetAttribute("group_id", group.id());
  span.SetAttribute("checks", static_cast<std::int64_t>(suite.size()));

  auto state = std::make_shared<Evaluation>();
  state->slots.resize(suite.size());

  util::Millis longest{0};
  for (std::size_t i = 0; i < suite.size(); ++i) {
    state->slots[i].result.name = suite[i]->Name();
    longest                     = std::max(longest, suite[i]->Timeout());
  }

  const auto deadline = util::SteadyClock::now() + longest + grace_;

  for (std::size_t i = 0; i < suite.size(); ++i) {
    queue_->Post("health_check", [state, check = suite[i], group, i] {
      std::shared_ptr<util::CancelToken> token;
      util::SteadyClock::time_point      start;
      {
        std::lock_guard lock(state->mutex);
        auto&           slot = state->slots[i];
        if (slot.result.outcome != CheckOutcome::kPending) return;
        slot.started    = true;
        slot.started_at = util::SteadyClock::now();
        start           = slot.started_at;
        token           = slot.cancel;
      }

      CheckVerdict verdict;
      try {
        verdict = check->Run(group, *token);
      } catch (const std::exception& e) {
        verdict = CheckVerdict::Fail(e.what());
      }

      const auto elapsed = Since(start);
      observability::Metrics::Instance().ObserveHealthCheckLatencyMs(check->Name(), verdict.passed, static_cast<double>(elapsed.count()));

      {
        std::lock_guard lock(state->mutex);
        auto&           slot = state->slots[i];
        // already decided by the evaluator (timeout, cancel)
        if (slot.result.outcome != CheckOutcome::kPending) return;
        state->Finish(slot, verdict.passed ? CheckOutcome::kPassed : CheckOutcome::kFailed, std::move(verdict.diagnostic), elapsed);
        if (state->failed) state->SkipUnstarted("skipped after an earlier check failed");
      }
      state->cv.notify_all();
    });
  }

  std::unique_lock lock(state->mutex);
  while (state->finished < state->slots.size()) {
    const auto now = util::SteadyClock::now();

    if (cancel != nullptr && cancel->IsCancelled()) {
      for (auto& slot : state->slots) {
        if (slot.result.outcome != CheckOutcome::kPending) continue;
        slot.cancel->Cancel();
        state->Finish(slot, CheckOutcome::kCancelled, "gate cancelled", slot.started ? Since(slot.started_at) : util::Millis(0));
      }
      break;
    }

    auto wake = std::min(deadline, now + kCancelPollInterval);
    for (std::size_t i = 0; i < state->slots.size(); ++i) {
      auto& slot = state->slots[i];
      if (!slot.started || slot.result.outcome != CheckOutcome::kPending) continue;

      const auto check_deadline = slot.started_at + suite[i]->Timeout();
      if (now >= check_deadline) {
        slot.cancel->Cancel();
        state->Finish(slot, CheckOutcome::kTimeout, "no answer within " + std::to_string(suite[i]->Timeout().count()) + "ms",
                      Since(slot.started_at));
        state->SkipUnstarted("skipped after an earlier check failed");
      } else {
        wake = std::min(wake, check_deadline);
      }
    }

    if (state->finished >= state->slots.size()) break;

    if (now >= deadline) {
      for (auto& slot : state->slots) {
        if (slot.result.outcome != CheckOutcome::kPending) continue;
        slot.cancel->Cancel();
        if (slot.started) {
          state->Finish(slot, CheckOutcome::kTimeout, "gate deadline reached", Since(slot.started_at));
        } else {
          state->Finish(slot, CheckOutcome::kSkipped, "not started before the gate deadline", util::Millis(0));
        }
      }
      break;
    }

    state->cv.wait_until(lock, wake);
  }

  for (const auto& slot : state->slots) gate.results.push_back(slot.result);
  lock.unlock();

  gate.passed = std::all_of(gate.results.begin(), gate.results.end(), [](const CheckResult& r) { return r.outcome == CheckOutcome::kPassed; });

  if (!gate.passed) {
    span.AddEvent("gate_failed");
    ROLLOUT_LOG_WARN("health gate failed",
                     {observability::StringField("group_id", group.id()), observability::StringField("failures", gate.Summary())});
  } else {
    ROLLOUT_LOG_DEBUG("health gate passed",
                      {observability::StringField("group_id", group.id()), observability::IntField("checks", static_cast<int64_t>(suite.size()))});
  }
  return gate;
}

} // namespace rollout::health
