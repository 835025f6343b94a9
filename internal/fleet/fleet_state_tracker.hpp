#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/collab/cluster_scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/traffic/traffic_splitter.hpp"

namespace rollout::fleet {

/*
  Authoritative record of every instance group the engine knows about.

  - Groups are cached in memory and written through to the repository.
  - Lifecycle never regresses (util::InvalidState).
  - Traffic weights are owned by the TrafficSplitter; the tracker applies
    them and mirrors each group's share into InstanceGroup.traffic_weight.
  - Must not be called while the caller holds a repository transaction.
*/
class FleetStateTracker {
 public:
  FleetStateTracker(std::shared_ptr<db::Repository> repository, collab::ClusterSchedulerPtr scheduler,
                    std::shared_ptr<traffic::TrafficSplitter> splitter);

  void Hydrate();

  // Registering an id twice returns the stored group unchanged.
  rollout::manager::v1::InstanceGroup Register(const rollout::manager::v1::InstanceGroup& group);

  // Moves PROVISIONING groups to READY once every desired replica is ready.
  rollout::manager::v1::InstanceGroup UpdateReadiness(const std::string& group_id, uint32_t ready_replicas);

  // Polls the scheduler; throws util::UnexpectedTermination if the group is gone.
  rollout::manager::v1::InstanceGroup RefreshReadiness(const std::string& group_id);

  rollout::manager::v1::InstanceGroup SetDesiredReplicas(const std::string& group_id, uint32_t replicas);

  rollout::manager::v1::InstanceGroup SetLifecycle(const std::string& group_id, rollout::manager::v1::LifecycleState state);

  // Adds or removes the group from the service's mirror set.
  traffic::WeightTablePtr SetMirror(const std::string& service_name, const std::string& group_id, bool mirrored);

  /*
    Gives `group_id` the requested weight and spreads the remainder over the
    service's other weighted groups in proportion to their current share.
    With no other weighted group the weight must be 0 or 100.
  */
  traffic::WeightTablePtr SetWeight(const std::string& service_name, const std::string& group_id, uint32_t weight);

  // Replaces the whole table for the service.
  traffic::WeightTablePtr SetWeights(const std::string& service_name, const std::map<std::string, uint32_t>& weights);

  // Groups not yet terminated.
  std::vector<rollout::manager::v1::InstanceGroup> Get(const std::string& service_name) const;

  // Empty service_name lists every service.
  std::vector<rollout::manager::v1::InstanceGroup> List(const std::string& service_name, bool include_terminated) const;

  std::optional<rollout::manager::v1::InstanceGroup> Find(const std::string& group_id) const;

  // The live group holding 100% of the service's traffic, if any.
  std::optional<rollout::manager::v1::InstanceGroup> ServingGroup(const std::string& service_name) const;

 private:
  rollout::manager::v1::InstanceGroup& Require(const std::string& group_id);

  // Caller holds mutex_ exclusively.
  void Persist(const rollout::manager::v1::InstanceGroup& group);
  void ApplyWeights(const traffic::WeightTable& table);

  std::shared_ptr<db::Repository>           repository_;
  collab::ClusterSchedulerPtr               scheduler_;
  std::shared_ptr<traffic::TrafficSplitter> splitter_;

  mutable std::shared_mutex                                            mutex_;
  std::unordered_map<std::string, rollout::manager::v1::InstanceGroup> groups_;
};

} // namespace rollout::fleet
