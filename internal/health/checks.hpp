#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "config/config.pb.h"
#include "health_check.hpp"
#include "internal/collab/cluster_scheduler.hpp"
#include "internal/collab/instance_prober.hpp"
#include "internal/collab/metrics_source.hpp"

namespace rollout::health {

// Passes when the group answers a liveness probe with a 2xx status.
class LivenessCheck final : public HealthCheck {
 public:
  LivenessCheck(std::string name, util::Millis timeout, collab::InstanceProberPtr prober);

  const std::string& Name() const override {
    return name_;
  }
  util::Millis Timeout() const override {
    return timeout_;
  }
  CheckVerdict Run(const rollout::manager::v1::InstanceGroup& group, const util::CancelToken& cancel) override;

 private:
  std::string               name_;
  util::Millis              timeout_;
  collab::InstanceProberPtr prober_;
};

// Every desired replica is ready according to the scheduler and the readiness probe answers 2xx.
class ReadinessCheck final : public HealthCheck {
 public:
  ReadinessCheck(std::string name, util::Millis timeout, collab::ClusterSchedulerPtr scheduler, collab::InstanceProberPtr prober);

  const std::string& Name() const override {
    return name_;
  }
  util::Millis Timeout() const override {
    return timeout_;
  }
  CheckVerdict Run(const rollout::manager::v1::InstanceGroup& group, const util::CancelToken& cancel) override;

 private:
  std::string                 name_;
  util::Millis                timeout_;
  collab::ClusterSchedulerPtr scheduler_;
  collab::InstanceProberPtr   prober_;
};

/*
  Sends a canned request and checks the status code and that the response
  body mentions every expected field.
*/
class SyntheticRequestCheck final : public HealthCheck {
 public:
  SyntheticRequestCheck(std::string name, util::Millis timeout, collab::InstanceProberPtr prober, std::string path, std::string body,
                        uint32_t expected_status, std::vector<std::string> expected_fields);

  const std::string& Name() const override {
    return name_;
  }
  util::Millis Timeout() const override {
    return timeout_;
  }
  CheckVerdict Run(const rollout::manager::v1::InstanceGroup& group, const util::CancelToken& cancel) override;

 private:
  std::string               name_;
  util::Millis              timeout_;
  collab::InstanceProberPtr prober_;
  std::string               path_;
  std::string               body_;
  uint32_t                  expected_status_;
  std::vector<std::string>  expected_fields_;
};

class MetricThresholdCheck final : public HealthCheck {
 public:
  MetricThresholdCheck(std::string name, util::Millis timeout, collab::MetricsSourcePtr metrics,
                       rollout::manager::v1::MetricThreshold threshold, util::Millis window);

  const std::string& Name() const override {
    return name_;
  }
  util::Millis Timeout() const override {
    return timeout_;
  }
  CheckVerdict Run(const rollout::manager::v1::InstanceGroup& group, const util::CancelToken& cancel) override;

 private:
  std::string                           name_;
  util::Millis                          timeout_;
  collab::MetricsSourcePtr              metrics_;
  rollout::manager::v1::MetricThreshold threshold_;
  util::Millis                          window_;
};

struct CheckDependencies {
  collab::InstanceProberPtr   prober;
  collab::ClusterSchedulerPtr scheduler;
  collab::MetricsSourcePtr    metrics;
};

// Instantiates configured checks. Specs are expected to be validated already.
CheckSuite BuildCheckSuite(const google::protobuf::RepeatedPtrField<rollout::runtime::config::CheckSpec>& specs,
                           const CheckDependencies& deps);

} // namespace rollout::health
