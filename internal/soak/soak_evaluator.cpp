#include "soak_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rollout::soak {

namespace v1 = rollout::manager::v1;

namespace {

constexpr double kEpsilon = 1e-9;

std::string Format(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

const std::vector<std::string>& DefaultDivergenceMetrics() {
  static const std::vector<std::string> kMetrics{"error_rate", "latency_p99_ms"};
  return kMetrics;
}

std::vector<std::string> MetricNames(const Thresholds& thresholds) {
  std::vector<std::string> names;
  for (const auto& threshold : thresholds) {
    if (std::find(names.begin(), names.end(), threshold.metric()) == names.end()) names.push_back(threshold.metric());
  }
  return names;
}

std::optional<Breach> EvaluateThreshold(const v1::MetricThreshold& threshold, const collab::MetricValues& values) {
  auto it = values.find(threshold.metric());
  if (it == values.end()) {
    return Breach{threshold.metric(), 0.0, threshold.limit(), "metric " + threshold.metric() + " has no data"};
  }

  const double value = it->second;
  const bool   max   = threshold.comparator() == v1::THRESHOLD_COMPARATOR_MAX;
  const bool   bad   = max ? value > threshold.limit() : value < threshold.limit();
  if (!bad) return std::nullopt;

  return Breach{threshold.metric(), value, threshold.limit(),
                threshold.metric() + "=" + Format(value) + (max ? " exceeds max " : " below min ") + Format(threshold.limit())};
}

std::optional<Breach> EvaluateThresholds(const Thresholds& thresholds, const collab::MetricValues& values) {
  for (const auto& threshold : thresholds) {
    if (auto breach = EvaluateThreshold(threshold, values)) return breach;
  }
  return std::nullopt;
}

std::optional<Breach> EvaluateDivergence(const std::vector<std::string>& metrics, const collab::MetricValues& live,
                                         const collab::MetricValues& shadow, double tolerance) {
  for (const auto& metric : metrics) {
    auto l = live.find(metric);
    auto s = shadow.find(metric);
    if (l == live.end() && s == shadow.end()) continue;
    if (l == live.end() || s == shadow.end()) {
      return Breach{metric, 0.0, tolerance, "metric " + metric + " reported by only one of live and shadow"};
    }

    const double divergence = std::fabs(s->second - l->second) / std::max(std::fabs(l->second), kEpsilon);
    if (divergence > tolerance) {
      return Breach{metric, divergence, tolerance,
                    metric + " shadow=" + Format(s->second) + " live=" + Format(l->second) + " diverges by " + Format(divergence) +
                        " (tolerance " + Format(tolerance) + ")"};
    }
  }
  return std::nullopt;
}

} // namespace rollout::soak
