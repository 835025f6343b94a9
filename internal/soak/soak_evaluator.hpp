#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/collab/metrics_source.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::soak {

struct Breach {
  std::string metric;
  double      value = 0.0;
  double      limit = 0.0;
  std::string diagnostic;
};

using Thresholds = google::protobuf::RepeatedPtrField<rollout::manager::v1::MetricThreshold>;

// Metrics compared for shadow divergence when no thresholds are configured.
const std::vector<std::string>& DefaultDivergenceMetrics();

std::vector<std::string> MetricNames(const Thresholds& thresholds);

// A metric missing from `values` counts as a breach.
std::optional<Breach> EvaluateThreshold(const rollout::manager::v1::MetricThreshold& threshold, const collab::MetricValues& values);

// First breached threshold in declaration order.
std::optional<Breach> EvaluateThresholds(const Thresholds& thresholds, const collab::MetricValues& values);

/*
  Relative divergence of the shadow group from the live group:
    |shadow - live| / max(|live|, epsilon) > tolerance
  Metrics absent on both sides are ignored; absent on one side is a breach.
*/
std::optional<Breach> EvaluateDivergence(const std::vector<std::string>& metrics, const collab::MetricValues& live,
                                         const collab::MetricValues& shadow, double tolerance);

} // namespace rollout::soak
