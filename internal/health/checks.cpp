#include "checks.hpp"

#include "internal/soak/soak_evaluator.hpp"
#include "internal/util/errors.hpp"

namespace rollout::health {

namespace v1 = rollout::manager::v1;

namespace {

constexpr util::Millis kDefaultTimeout{5000};
constexpr util::Millis kDefaultWindow{60000};

bool Is2xx(uint32_t status) {
  return status >= 200 && status < 300;
}

std::string Describe(const v1::ProbeResponse& response) {
  if (!response.reachable()) return "unreachable";
  return "status " + std::to_string(response.status_code());
}

} // namespace

LivenessCheck::LivenessCheck(std::string name, util::Millis timeout, collab::InstanceProberPtr prober)
    : name_(std::move(name)), timeout_(timeout), prober_(std::move(prober)) {
}

CheckVerdict LivenessCheck::Run(const v1::InstanceGroup& group, const util::CancelToken& cancel) {
  v1::ProbeRequest request;
  request.set_kind(v1::PROBE_KIND_LIVENESS);

  const auto response = prober_->Probe(group, request, cancel);
  if (response.reachable() && Is2xx(response.status_code())) return CheckVerdict::Pass();
  return CheckVerdict::Fail("liveness probe: " + Describe(response));
}

ReadinessCheck::ReadinessCheck(std::string name, util::Millis timeout, collab::ClusterSchedulerPtr scheduler,
                               collab::InstanceProberPtr prober)
    : name_(std::move(name)), timeout_(timeout), scheduler_(std::move(scheduler)), prober_(std::move(prober)) {
}

CheckVerdict ReadinessCheck::Run(const v1::InstanceGroup& group, const util::CancelToken& cancel) {
  const auto status = scheduler_->GetReplicaStatus(group.id());
  if (status.terminated()) {
    return CheckVerdict::Fail("group terminated");
  }
  if (status.ready_replicas() < status.desired_replicas() || status.desired_replicas() == 0) {
    return CheckVerdict::Fail(std::to_string(status.ready_replicas()) + "/" + std::to_string(status.desired_replicas()) +
                              " replicas ready");
  }

  v1::ProbeRequest request;
  request.set_kind(v1::PROBE_KIND_READINESS);

  const auto response = prober_->Probe(group, request, cancel);
  if (response.reachable() && Is2xx(response.status_code())) return CheckVerdict::Pass();
  return CheckVerdict::Fail("readiness probe: " + Describe(response));
}

SyntheticRequestCheck::SyntheticRequestCheck(std::string name, util::Millis timeout, collab::InstanceProberPtr prober, std::string path,
                                             std::string body, uint32_t expected_status, std::vector<std::string> expected_fields)
    : name_(std::move(name)),
      timeout_(timeout),
      prober_(std::move(prober)),
      path_(std::move(path)),
      body_(std::move(body)),
      expected_status_(expected_status == 0 ? 200 : expected_status),
      expected_fields_(std::move(expected_fields)) {
}

CheckVerdict SyntheticRequestCheck::Run(const v1::InstanceGroup& group, const util::CancelToken& cancel) {
  v1::ProbeRequest request;
  request.set_kind(v1::PROBE_KIND_SYNTHETIC);
  request.set_path(path_);
  request.set_body(body_);

  const auto response = prober_->Probe(group, request, cancel);
  if (!response.reachable()) {
    return CheckVerdict::Fail(path_ + ": unreachable");
  }
  if (response.status_code() != expected_status_) {
    return CheckVerdict::Fail(path_ + ": status " + std::to_string(response.status_code()) + ", expected " +
                              std::to_string(expected_status_));
  }
  for (const auto& field : expected_fields_) {
    if (response.body().find("\"" + field + "\"") == std::string::npos) {
      return CheckVerdict::Fail(path_ + ": response lacks field " + field);
    }
  }
  return CheckVerdict::Pass();
}

MetricThresholdCheck::MetricThresholdCheck(std::string name, util::Millis timeout, collab::MetricsSourcePtr metrics,
                                           v1::MetricThreshold threshold, util::Millis window)
    : name_(std::move(name)), timeout_(timeout), metrics_(std::move(metrics)), threshold_(std::move(threshold)), window_(window) {
}

CheckVerdict MetricThresholdCheck::Run(const v1::InstanceGroup& group, const util::CancelToken&) {
  const auto values = metrics_->Query(group.service_name(), group.id(), {threshold_.metric()}, window_);
  if (auto breach = soak::EvaluateThreshold(threshold_, values)) {
    return CheckVerdict::Fail(breach->diagnostic);
  }
  return CheckVerdict::Pass();
}

CheckSuite BuildCheckSuite(const google::protobuf::RepeatedPtrField<rollout::runtime::config::CheckSpec>& specs,
                           const CheckDependencies& deps) {
  CheckSuite suite;
  for (const auto& spec : specs) {
    const auto timeout = util::OrDefault(spec.timeout(), kDefaultTimeout);

    switch (spec.kind()) {
      case rollout::runtime::config::CHECK_KIND_LIVENESS:
        suite.push_back(std::make_shared<LivenessCheck>(spec.name(), timeout, deps.prober));
        break;
      case rollout::runtime::config::CHECK_KIND_READINESS:
        suite.push_back(std::make_shared<ReadinessCheck>(spec.name(), timeout, deps.scheduler, deps.prober));
        break;
      case rollout::runtime::config::CHECK_KIND_SYNTHETIC:
        suite.push_back(std::make_shared<SyntheticRequestCheck>(
            spec.name(), timeout, deps.prober, spec.path(), spec.body(), spec.expected_status(),
            std::vector<std::string>(spec.expected_fields().begin(), spec.expected_fields().end())));
        break;
      case rollout::runtime::config::CHECK_KIND_METRIC:
        suite.push_back(std::make_shared<MetricThresholdCheck>(spec.name(), timeout, deps.metrics, spec.threshold(),
                                                               util::OrDefault(spec.window(), kDefaultWindow)));
        break;
      default:
        throw util::InvalidArgument("health check " + spec.name() + " has no kind");
    }
  }
  return suite;
}

} // namespace rollout::health
