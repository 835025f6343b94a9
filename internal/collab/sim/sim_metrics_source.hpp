#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/collab/metrics_source.hpp"

namespace rollout::collab::sim {

/*
  Simulated telemetry. Each group reports the baseline value for a metric
  unless a per-group override is set.
*/
class SimMetricsSource final : public MetricsSource {
 public:
  explicit SimMetricsSource(MetricValues baseline = {});

  MetricValues Query(const std::string& service_name, const std::string& group_id, const std::vector<std::string>& metrics,
                     util::Millis window) override;

  void Subscribe(AlertCallback callback) override;

  void SetBaseline(const std::string& metric, double value);
  void SetGroupMetric(const std::string& group_id, const std::string& metric, double value);

  // Invokes every subscriber synchronously on the calling thread.
  void PushAlert(const rollout::manager::v1::MetricAlert& alert);

 private:
  mutable std::mutex                                  mutex_;
  MetricValues                                        baseline_;
  std::unordered_map<std::string, MetricValues>       overrides_;
  std::vector<AlertCallback>                          subscribers_;
};

} // namespace rollout::collab::sim
