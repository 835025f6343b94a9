#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::collab {

using MetricValues  = std::map<std::string, double>;
using AlertCallback = std::function<void(const rollout::manager::v1::MetricAlert&)>;

/*
  Telemetry source.

  Query() returns the aggregate of each requested metric over the trailing
  window for one group. Metrics with no data are left out of the result.
  Subscribe() registers a push callback for out-of-band alerts; callbacks
  may run on any thread.
*/
class MetricsSource {
 public:
  virtual ~MetricsSource() = default;

  virtual MetricValues Query(const std::string& service_name, const std::string& group_id, const std::vector<std::string>& metrics,
                             util::Millis window) = 0;

  virtual void Subscribe(AlertCallback callback) = 0;
};

using MetricsSourcePtr = std::shared_ptr<MetricsSource>;

} // namespace rollout::collab
