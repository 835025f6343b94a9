#include "sim_cluster_scheduler.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rollout::collab::sim {

namespace v1 = rollout::manager::v1;

SimClusterScheduler::SimClusterScheduler(util::Millis ready_delay) : ready_delay_(ready_delay) {
}

void SimClusterScheduler::MaybeFail() {
  if (pending_failures_ > 0) {
    --pending_failures_;
    throw util::Unavailable("cluster scheduler unavailable");
  }
}

SimClusterScheduler::Group& SimClusterScheduler::Require(const std::string& group_id) {
  auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    throw util::NotFound("instance group not found: " + group_id);
  }
  return it->second;
}

std::string SimClusterScheduler::CreateInstanceGroup(const v1::InstanceGroupSpec& spec) {
  std::lock_guard lock(mutex_);
  ++create_calls_;
  MaybeFail();

  if (!spec.request_token().empty()) {
    auto it = by_token_.find(spec.request_token());
    if (it != by_token_.end()) return it->second;
  }

  const auto id = util::NewId("ig-");
  Group      group;
  group.spec     = spec;
  group.desired  = spec.replicas();
  group.ready_at = util::SteadyClock::now() + ready_delay_;
  groups_.emplace(id, std::move(group));

  if (!spec.request_token().empty()) by_token_[spec.request_token()] = id;
  return id;
}

void SimClusterScheduler::ScaleInstanceGroup(const std::string& group_id, uint32_t replicas) {
  std::lock_guard lock(mutex_);
  MaybeFail();

  auto& group = Require(group_id);
  if (group.terminated) {
    throw util::UnexpectedTermination("instance group " + group_id + " is terminated");
  }

  if (replicas > group.desired) {
    group.ready_at = util::SteadyClock::now() + ready_delay_;
  }
  group.desired = replicas;
  group.ready   = std::min(group.ready, replicas);
}

void SimClusterScheduler::TerminateInstanceGroup(const std::string& group_id) {
  std::lock_guard lock(mutex_);
  MaybeFail();

  auto& group = Require(group_id);
  if (!group.terminated) {
    group.terminated = true;
    group.ready      = 0;
    terminated_order_.push_back(group_id);
  }
}

v1::ReplicaStatus SimClusterScheduler::GetReplicaStatus(const std::string& group_id) {
  std::lock_guard lock(mutex_);
  MaybeFail();

  auto& group = Require(group_id);
  if (!group.terminated && !held_versions_.contains(group.spec.artifact().version()) && util::SteadyClock::now() >= group.ready_at) {
    group.ready = group.desired;
  }

  v1::ReplicaStatus status;
  status.set_group_id(group_id);
  status.set_desired_replicas(group.desired);
  status.set_ready_replicas(group.ready);
  status.set_terminated(group.terminated);
  if (group.terminated) status.set_detail("terminated");
  return status;
}

void SimClusterScheduler::SetReadyDelay(util::Millis delay) {
  std::lock_guard lock(mutex_);
  ready_delay_ = delay;
}

void SimClusterScheduler::HoldReadiness(const std::string& version, bool hold) {
  std::lock_guard lock(mutex_);
  if (hold) {
    held_versions_.insert(version);
  } else {
    held_versions_.erase(version);
  }
}

void SimClusterScheduler::Kill(const std::string& group_id) {
  std::lock_guard lock(mutex_);
  auto& group      = Require(group_id);
  group.terminated = true;
  group.ready      = 0;
}

void SimClusterScheduler::FailNextCalls(uint32_t count) {
  std::lock_guard lock(mutex_);
  pending_failures_ = count;
}

uint64_t SimClusterScheduler::CreateCalls() const {
  std::lock_guard lock(mutex_);
  return create_calls_;
}

std::vector<std::string> SimClusterScheduler::TerminatedGroups() const {
  std::lock_guard lock(mutex_);
  return terminated_order_;
}

uint32_t SimClusterScheduler::DesiredReplicas(const std::string& group_id) const {
  std::lock_guard lock(mutex_);
  auto it = groups_.find(group_id);
  return it == groups_.end() ? 0 : it->second.desired;
}

} // namespace rollout::collab::sim
