#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

#include "internal/util/time.hpp"
#include "rollout/manager/v1.hpp"

namespace rollout::traffic {

/*
  Immutable snapshot of one service's traffic table.

  Groups missing from `weights` receive no traffic. Mirrored groups get a
  copy of live requests whose responses are discarded. Weights sum to 100,
  or to 0 before the first deploy.
*/
struct WeightTable {
  std::string                     service_name;
  uint64_t                        version = 0;
  std::map<std::string, uint32_t> weights;
  std::set<std::string>           mirrors;
  util::TimePoint                 updated_at{};

  uint32_t Sum() const {
    uint32_t total = 0;
    for (const auto& [group, weight] : weights) total += weight;
    return total;
  }

  uint32_t WeightOf(const std::string& group_id) const {
    auto it = weights.find(group_id);
    return it == weights.end() ? 0 : it->second;
  }

  rollout::manager::v1::TrafficSplit ToProto() const {
    rollout::manager::v1::TrafficSplit split;
    split.set_service_name(service_name);
    split.set_version(version);
    for (const auto& [group, weight] : weights) (*split.mutable_weights())[group] = weight;
    for (const auto& group : mirrors) split.add_mirrors(group);
    if (version > 0) *split.mutable_updated_at() = util::ToProto(updated_at);
    return split;
  }

  static WeightTable FromProto(const rollout::manager::v1::TrafficSplit& split) {
    WeightTable table;
    table.service_name = split.service_name();
    table.version      = split.version();
    for (const auto& [group, weight] : split.weights()) table.weights[group] = weight;
    table.mirrors.insert(split.mirrors().begin(), split.mirrors().end());
    table.updated_at = util::FromProto(split.updated_at());
    return table;
  }
};

} // namespace rollout::traffic
