#include "internal/health/health_gate.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/collab/sim/sim_cluster_scheduler.hpp"
#include "internal/collab/sim/sim_instance_prober.hpp"
#include "internal/collab/sim/sim_metrics_source.hpp"
#include "internal/health/checks.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace {

namespace v1  = rollout::manager::v1;
namespace cfg = rollout::runtime::config;

using rollout::health::CheckOutcome;
using rollout::health::CheckSuite;
using rollout::health::CheckVerdict;
using rollout::health::HealthCheck;
using rollout::health::HealthGate;
using rollout::runtime::TaskQueue;
using rollout::runtime::WorkerPool;
using rollout::util::CancelToken;
using rollout::util::Millis;
using rollout::util::SteadyClock;

// Sleeps `delay` (cancellable), then answers `pass`.
class FakeCheck final : public HealthCheck {
 public:
  FakeCheck(std::string name, bool pass, Millis delay, Millis timeout = Millis(2000))
      : name_(std::move(name)), pass_(pass), delay_(delay), timeout_(timeout) {
  }

  const std::string& Name() const override {
    return name_;
  }
  Millis Timeout() const override {
    return timeout_;
  }

  CheckVerdict Run(const v1::InstanceGroup&, const CancelToken& cancel) override {
    runs_.fetch_add(1);
    if (delay_.count() > 0 && cancel.WaitFor(delay_)) {
      return CheckVerdict::Fail("interrupted");
    }
    return pass_ ? CheckVerdict::Pass() : CheckVerdict::Fail(name_ + " said no");
  }

  int Runs() const {
    return runs_.load();
  }

 private:
  std::string      name_;
  bool             pass_;
  Millis           delay_;
  Millis           timeout_;
  std::atomic<int> runs_{0};
};

struct GateFixture {
  explicit GateFixture(std::size_t threads) : pool(queue, threads, "health-gate-test") {
    pool.Start();
  }
  ~GateFixture() {
    pool.Stop();
  }

  std::shared_ptr<TaskQueue> queue = std::make_shared<TaskQueue>();
  WorkerPool                 pool;
  HealthGate                 gate{queue, Millis(200)};
};

v1::InstanceGroup Group(const std::string& version) {
  v1::InstanceGroup group;
  group.set_id("ig-" + version);
  group.set_service_name("checkout");
  group.mutable_artifact()->set_version(version);
  group.set_desired_replicas(2);
  return group;
}

void TestEmptySuitePasses() {
  GateFixture f(1);
  const auto  result = f.gate.Evaluate(Group("1.0"), {});
  assert(result.passed);
  assert(result.results.empty());
}

void TestAllPassingChecksRunConcurrently() {
  GateFixture f(4);
  CheckSuite  suite;
  for (int i = 0; i < 4; ++i) {
    suite.push_back(std::make_shared<FakeCheck>("check-" + std::to_string(i), true, Millis(150)));
  }

  const auto start  = SteadyClock::now();
  const auto result = f.gate.Evaluate(Group("1.0"), suite);
  const auto took   = SteadyClock::now() - start;

  assert(result.passed);
  assert(result.results.size() == 4);
  for (const auto& r : result.results) assert(r.outcome == CheckOutcome::kPassed);
  assert(took < Millis(550));
}

void TestFirstFailureSkipsUnstartedChecks() {
  GateFixture f(1);
  auto        failing = std::make_shared<FakeCheck>("fails", false, Millis(0));
  auto        later   = std::make_shared<FakeCheck>("later", true, Millis(0));
  CheckSuite  suite{failing, later};

  const auto result = f.gate.Evaluate(Group("1.0"), suite);
  assert(!result.passed);
  assert(result.results[0].outcome == CheckOutcome::kFailed);
  assert(result.results[1].outcome == CheckOutcome::kSkipped);
  assert(later->Runs() == 0);
  assert(result.Summary().find("fails: FAILED (fails said no)") != std::string::npos);
}

void TestSlowCheckTimesOut() {
  GateFixture f(2);
  CheckSuite  suite{std::make_shared<FakeCheck>("slow", true, Millis(5000), Millis(100))};

  const auto start  = SteadyClock::now();
  const auto result = f.gate.Evaluate(Group("1.0"), suite);
  assert(!result.passed);
  assert(result.results[0].outcome == CheckOutcome::kTimeout);
  assert(SteadyClock::now() - start < Millis(2000));
}

void TestCancelMarksChecksCancelled() {
  GateFixture f(2);
  CheckSuite  suite{std::make_shared<FakeCheck>("long", true, Millis(5000), Millis(10000))};

  CancelToken cancel;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();
  });

  const auto result = f.gate.Evaluate(Group("1.0"), suite, &cancel);
  canceller.join();

  assert(!result.passed);
  assert(result.results[0].outcome == CheckOutcome::kCancelled);
}

void TestBuiltInChecksAgainstSimulatedGroup() {
  GateFixture f(4);

  auto scheduler = std::make_shared<rollout::collab::sim::SimClusterScheduler>();
  auto prober    = std::make_shared<rollout::collab::sim::SimInstanceProber>();
  auto metrics   = std::make_shared<rollout::collab::sim::SimMetricsSource>(rollout::collab::MetricValues{{"error_rate", 0.01}});

  v1::InstanceGroupSpec spec;
  spec.set_service_name("checkout");
  spec.mutable_artifact()->set_version("2.0");
  spec.set_replicas(2);
  auto group = Group("2.0");
  group.set_id(scheduler->CreateInstanceGroup(spec));

  google::protobuf::RepeatedPtrField<cfg::CheckSpec> specs;
  auto* live = specs.Add();
  live->set_name("liveness");
  live->set_kind(cfg::CHECK_KIND_LIVENESS);
  auto* ready = specs.Add();
  ready->set_name("readiness");
  ready->set_kind(cfg::CHECK_KIND_READINESS);
  auto* synthetic = specs.Add();
  synthetic->set_name("smoke");
  synthetic->set_kind(cfg::CHECK_KIND_SYNTHETIC);
  synthetic->set_path("/checkout/quote");
  synthetic->add_expected_fields("version");
  auto* metric = specs.Add();
  metric->set_name("errors");
  metric->set_kind(cfg::CHECK_KIND_METRIC);
  metric->mutable_threshold()->set_metric("error_rate");
  metric->mutable_threshold()->set_comparator(v1::THRESHOLD_COMPARATOR_MAX);
  metric->mutable_threshold()->set_limit(0.05);

  rollout::health::CheckDependencies deps{prober, scheduler, metrics};
  const auto                         suite = rollout::health::BuildCheckSuite(specs, deps);
  assert(suite.size() == 4);

  assert(f.gate.Evaluate(group, suite).passed);

  metrics->SetGroupMetric(group.id(), "error_rate", 0.2);
  auto breached = f.gate.Evaluate(group, suite);
  assert(!breached.passed);
  assert(breached.Failures().size() == 1);
  assert(breached.Failures()[0].name == "errors");

  metrics->SetGroupMetric(group.id(), "error_rate", 0.0);
  prober->SetVersionHealthy("2.0", false);
  assert(!f.gate.Evaluate(group, suite).passed);
}

} // namespace

int main() {
  TestEmptySuitePasses();
  TestAllPassingChecksRunConcurrently();
  TestFirstFailureSkipsUnstartedChecks();
  TestSlowCheckTimesOut();
  TestCancelMarksChecksCancelled();
  TestBuiltInChecksAgainstSimulatedGroup();

  std::cout << "rollout_manager_unit_health_gate: pass\n";
  return 0;
}
