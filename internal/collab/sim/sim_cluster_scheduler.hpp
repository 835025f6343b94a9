#pragma once

#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/collab/cluster_scheduler.hpp"
#include "internal/util/time.hpp"

namespace rollout::collab::sim {

/*
  Simulated scheduler.

  A group reports all desired replicas ready once `ready_delay` has passed
  since its last create or scale-up. Scale-downs are immediate. Versions
  can be held back to simulate provisioning that never completes.
*/
class SimClusterScheduler final : public ClusterScheduler {
 public:
  explicit SimClusterScheduler(util::Millis ready_delay = util::Millis(0));

  std::string CreateInstanceGroup(const rollout::manager::v1::InstanceGroupSpec& spec) override;

  void ScaleInstanceGroup(const std::string& group_id, uint32_t replicas) override;

  void TerminateInstanceGroup(const std::string& group_id) override;

  rollout::manager::v1::ReplicaStatus GetReplicaStatus(const std::string& group_id) override;

  void SetReadyDelay(util::Millis delay);

  // Groups running this artifact version never become ready.
  void HoldReadiness(const std::string& version, bool hold);

  // Marks the group terminated behind the controller's back.
  void Kill(const std::string& group_id);

  // The next `count` scheduler calls throw util::Unavailable.
  void FailNextCalls(uint32_t count);

  uint64_t CreateCalls() const;

  std::vector<std::string> TerminatedGroups() const;

  uint32_t DesiredReplicas(const std::string& group_id) const;

 private:
  struct Group {
    rollout::manager::v1::InstanceGroupSpec spec;
    uint32_t                                desired = 0;
    uint32_t                                ready   = 0;
    util::SteadyClock::time_point           ready_at;
    bool                                    terminated = false;
  };

  void MaybeFail();
  Group& Require(const std::string& group_id);

  mutable std::mutex                     mutex_;
  util::Millis                           ready_delay_;
  std::unordered_map<std::string, Group> groups_;
  std::unordered_map<std::string, std::string> by_token_;
  std::set<std::string>                  held_versions_;
  std::vector<std::string>               terminated_order_;
  uint32_t                               pending_failures_ = 0;
  uint64_t                               create_calls_     = 0;
};

} // namespace rollout::collab::sim
