#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "rollout/manager/v1.hpp"

namespace rollout::collab {

/*
  Cluster scheduler owning the actual instances.

  All calls may throw util::Unavailable; callers retry. Creates carry a
  request token so a retried or replayed create returns the existing group
  instead of provisioning a second one.
*/
class ClusterScheduler {
 public:
  virtual ~ClusterScheduler() = default;

  // ------------------------------------------------------------------
  // Create
  // ------------------------------------------------------------------
  /*
    Starts provisioning and returns the group id immediately. Readiness is
    observed through GetReplicaStatus().
  */
  virtual std::string CreateInstanceGroup(const rollout::manager::v1::InstanceGroupSpec& spec) = 0;

  // ------------------------------------------------------------------
  // Scale
  // ------------------------------------------------------------------
  virtual void ScaleInstanceGroup(const std::string& group_id, uint32_t replicas) = 0;

  // ------------------------------------------------------------------
  // Terminate
  // ------------------------------------------------------------------
  // Idempotent; terminating an already terminated group succeeds.
  virtual void TerminateInstanceGroup(const std::string& group_id) = 0;

  // ------------------------------------------------------------------
  // Status
  // ------------------------------------------------------------------
  // util::NotFound for ids the scheduler never issued.
  virtual rollout::manager::v1::ReplicaStatus GetReplicaStatus(const std::string& group_id) = 0;
};

using ClusterSchedulerPtr = std::shared_ptr<ClusterScheduler>;

} // namespace rollout::collab
