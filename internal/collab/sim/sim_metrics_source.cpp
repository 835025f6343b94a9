#include "sim_metrics_source.hpp"

namespace rollout::collab::sim {

SimMetricsSource::SimMetricsSource(MetricValues baseline) : baseline_(std::move(baseline)) {
}

MetricValues SimMetricsSource::Query(const std::string&, const std::string& group_id, const std::vector<std::string>& metrics,
                                     util::Millis) {
  std::lock_guard lock(mutex_);

  MetricValues out;
  auto         group_it = overrides_.find(group_id);
  for (const auto& metric : metrics) {
    if (group_it != overrides_.end()) {
      auto it = group_it->second.find(metric);
      if (it != group_it->second.end()) {
        out[metric] = it->second;
        continue;
      }
    }
    auto it = baseline_.find(metric);
    if (it != baseline_.end()) out[metric] = it->second;
  }
  return out;
}

void SimMetricsSource::Subscribe(AlertCallback callback) {
  std::lock_guard lock(mutex_);
  subscribers_.push_back(std::move(callback));
}

void SimMetricsSource::SetBaseline(const std::string& metric, double value) {
  std::lock_guard lock(mutex_);
  baseline_[metric] = value;
}

void SimMetricsSource::SetGroupMetric(const std::string& group_id, const std::string& metric, double value) {
  std::lock_guard lock(mutex_);
  overrides_[group_id][metric] = value;
}

void SimMetricsSource::PushAlert(const rollout::manager::v1::MetricAlert& alert) {
  std::vector<AlertCallback> subscribers;
  {
    std::lock_guard lock(mutex_);
    subscribers = subscribers_;
  }
  for (const auto& callback : subscribers) {
    callback(alert);
  }
}

} // namespace rollout::collab::sim
