#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/collab/instance_prober.hpp"
#include "internal/util/time.hpp"

namespace rollout::collab::sim {

/*
  Simulated prober. Every group answers 200 with a small JSON body unless
  marked unhealthy by id or artifact version.
*/
class SimInstanceProber final : public InstanceProber {
 public:
  rollout::manager::v1::ProbeResponse Probe(const rollout::manager::v1::InstanceGroup& group,
                                            const rollout::manager::v1::ProbeRequest& request, const util::CancelToken& cancel) override;

  void SetVersionHealthy(const std::string& version, bool healthy);
  void SetGroupHealthy(const std::string& group_id, bool healthy);

  // Probes against this version take `delay` before answering.
  void SetVersionLatency(const std::string& version, util::Millis delay);

  // The version turns unhealthy once its group is scaled to `replicas` or more.
  void FailWhenReplicasAtLeast(const std::string& version, uint32_t replicas);

  uint64_t ProbeCount() const;

 private:
  bool Healthy(const rollout::manager::v1::InstanceGroup& group) const;

  mutable std::mutex                      mutex_;
  std::set<std::string>                   unhealthy_versions_;
  std::set<std::string>                   unhealthy_groups_;
  std::map<std::string, util::Millis>     latency_;
  std::map<std::string, uint32_t>         replica_limit_;
  uint64_t                                probes_ = 0;
};

} // namespace rollout::collab::sim
