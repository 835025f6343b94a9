#include "fleet_state_tracker.hpp"

#include <algorithm>
#include <cmath>

#include "internal/db/api/result_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rollout::fleet {

namespace v1 = rollout::manager::v1;

FleetStateTracker::FleetStateTracker(std::shared_ptr<db::Repository> repository, collab::ClusterSchedulerPtr scheduler,
                                     std::shared_ptr<traffic::TrafficSplitter> splitter)
    : repository_(std::move(repository)), scheduler_(std::move(scheduler)), splitter_(std::move(splitter)) {
}

void FleetStateTracker::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListInstanceGroups(*tx, "");
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& record : records) {
    groups_[record.id] = record.body;
  }

  ROLLOUT_LOG_INFO("instance groups hydrated", {observability::IntField("groups", static_cast<int64_t>(records.size()))});
}

v1::InstanceGroup& FleetStateTracker::Require(const std::string& group_id) {
  auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    throw util::NotFound("instance group not found: " + group_id);
  }
  return it->second;
}

void FleetStateTracker::Persist(const v1::InstanceGroup& group) {
  db::model::InstanceGroupRecord record;
  record.id              = group.id();
  record.service_name    = group.service_name();
  record.lifecycle_state = group.lifecycle_state();
  record.updated_at_ms   = util::NowMillis();
  record.body            = group;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertInstanceGroup(*tx, record), "persist instance group " + group.id());
  tx->Commit();
}

v1::InstanceGroup FleetStateTracker::Register(const v1::InstanceGroup& group) {
  if (group.id().empty() || group.service_name().empty()) {
    throw util::InvalidArgument("instance group needs an id and a service name");
  }

  std::unique_lock lock(mutex_);
  auto             it = groups_.find(group.id());
  if (it != groups_.end()) {
    if (it->second.service_name() != group.service_name()) {
      throw util::AlreadyExists("instance group " + group.id() + " belongs to service " + it->second.service_name());
    }
    return it->second;
  }

  auto stored = group;
  if (stored.lifecycle_state() == v1::LIFECYCLE_STATE_UNSPECIFIED) stored.set_lifecycle_state(v1::LIFECYCLE_STATE_PROVISIONING);
  if (!stored.has_created_at()) *stored.mutable_created_at() = util::ToProto(util::Now());
  stored.set_traffic_weight(0);

  Persist(stored);
  groups_[stored.id()] = stored;

  ROLLOUT_LOG_INFO("instance group registered",
                   {observability::StringField("group_id", stored.id()), observability::StringField("service", stored.service_name()),
                    observability::StringField("artifact", stored.artifact().name() + "@" + stored.artifact().version()),
                    observability::IntField("replicas", stored.desired_replicas())});
  return stored;
}

v1::InstanceGroup FleetStateTracker::UpdateReadiness(const std::string& group_id, uint32_t ready_replicas) {
  std::unique_lock lock(mutex_);
  auto             next = Require(group_id);

  next.set_ready_replicas(std::min(ready_replicas, next.desired_replicas()));
  if (next.lifecycle_state() == v1::LIFECYCLE_STATE_PROVISIONING && next.ready_replicas() == next.desired_replicas() &&
      next.desired_replicas() > 0) {
    next.set_lifecycle_state(v1::LIFECYCLE_STATE_READY);
  }

  if (next.ready_replicas() != groups_[group_id].ready_replicas() || next.lifecycle_state() != groups_[group_id].lifecycle_state()) {
    Persist(next);
    groups_[group_id] = next;
  }
  return next;
}

v1::InstanceGroup FleetStateTracker::RefreshReadiness(const std::string& group_id) {
  const auto status = scheduler_->GetReplicaStatus(group_id);
  if (status.terminated()) {
    throw util::UnexpectedTermination("instance group " + group_id + " was terminated by the cluster" +
                                      (status.detail().empty() ? "" : ": " + status.detail()));
  }
  return UpdateReadiness(group_id, status.ready_replicas());
}

v1::InstanceGroup FleetStateTracker::SetDesiredReplicas(const std::string& group_id, uint32_t replicas) {
  std::unique_lock lock(mutex_);
  auto             next = Require(group_id);
  if (next.desired_replicas() == replicas) return next;

  next.set_desired_replicas(replicas);
  next.set_ready_replicas(std::min(next.ready_replicas(), replicas));
  Persist(next);
  groups_[group_id] = next;
  return next;
}

v1::InstanceGroup FleetStateTracker::SetLifecycle(const std::string& group_id, v1::LifecycleState state) {
  std::unique_lock lock(mutex_);
  auto             next = Require(group_id);

  if (next.lifecycle_state() == state) return next;
  if (!model::CanTransition(next.lifecycle_state(), state)) {
    throw util::InvalidState("instance group " + group_id + " cannot move from " + std::string(model::ToString(next.lifecycle_state())) +
                             " to " + std::string(model::ToString(state)));
  }

  next.set_lifecycle_state(state);
  Persist(next);
  groups_[group_id] = next;

  ROLLOUT_LOG_INFO("instance group lifecycle", {observability::StringField("group_id", group_id),
                                                observability::StringField("state", model::ToString(state))});
  return next;
}

traffic::WeightTablePtr FleetStateTracker::SetMirror(const std::string& service_name, const std::string& group_id, bool mirrored) {
  std::unique_lock lock(mutex_);
  if (mirrored && !model::IsLive(Require(group_id).lifecycle_state())) {
    throw util::InvalidState("group " + group_id + " is terminated and cannot be mirrored");
  }

  auto table = mirrored ? splitter_->SetMirror(service_name, group_id) : splitter_->ClearMirror(service_name, group_id);
  ApplyWeights(*table);
  return table;
}

void FleetStateTracker::ApplyWeights(const traffic::WeightTable& table) {
  for (auto& [id, group] : groups_) {
    if (group.service_name() != table.service_name || !model::IsLive(group.lifecycle_state())) continue;

    const auto weight   = table.WeightOf(id);
    const bool mirrored = table.mirrors.contains(id);
    if (group.traffic_weight() == weight && group.mirrored() == mirrored) continue;

    auto next = group;
    next.set_traffic_weight(weight);
    next.set_mirrored(mirrored);
    Persist(next);
    group = std::move(next);
  }
}

traffic::WeightTablePtr FleetStateTracker::SetWeights(const std::string& service_name, const std::map<std::string, uint32_t>& weights) {
  std::unique_lock lock(mutex_);

  for (const auto& [group_id, weight] : weights) {
    const auto& group = Require(group_id);
    if (group.service_name() != service_name) {
      throw util::InvalidArgument("group " + group_id + " does not belong to service " + service_name);
    }
    if (weight > 0 && !model::IsLive(group.lifecycle_state())) {
      throw util::InvalidState("group " + group_id + " is terminated and cannot receive traffic");
    }
  }

  auto table = splitter_->SetWeights(service_name, weights);
  ApplyWeights(*table);
  return table;
}

traffic::WeightTablePtr FleetStateTracker::SetWeight(const std::string& service_name, const std::string& group_id, uint32_t weight) {
  if (weight > 100) {
    throw util::InvalidArgument("traffic weight " + std::to_string(weight) + " exceeds 100");
  }

  const auto current = splitter_->GetWeights(service_name);

  std::map<std::string, uint32_t> others;
  uint32_t                        others_total = 0;
  for (const auto& [id, w] : current->weights) {
    if (id == group_id || w == 0) continue;
    others[id] = w;
    others_total += w;
  }

  std::map<std::string, uint32_t> next;
  next[group_id] = weight;

  const uint32_t remainder = 100 - weight;
  if (others.empty()) {
    if (remainder != 0 && weight != 0) {
      throw util::InvalidArgument("no other weighted group in " + service_name + " to take the remaining " + std::to_string(remainder) + "%");
    }
  } else {
    // largest share absorbs rounding so the table still sums to 100
    uint32_t    assigned = 0;
    std::string largest;
    for (const auto& [id, w] : others) {
      const auto share = static_cast<uint32_t>(std::floor(static_cast<double>(remainder) * w / others_total));
      next[id]         = share;
      assigned += share;
      if (largest.empty() || w > others[largest]) largest = id;
    }
    next[largest] += remainder - assigned;
  }

  return SetWeights(service_name, next);
}

std::vector<v1::InstanceGroup> FleetStateTracker::Get(const std::string& service_name) const {
  return List(service_name, false);
}

std::vector<v1::InstanceGroup> FleetStateTracker::List(const std::string& service_name, bool include_terminated) const {
  std::shared_lock lock(mutex_);

  std::vector<v1::InstanceGroup> out;
  for (const auto& [id, group] : groups_) {
    if (!service_name.empty() && group.service_name() != service_name) continue;
    if (!include_terminated && !model::IsLive(group.lifecycle_state())) continue;
    out.push_back(group);
  }

  std::sort(out.begin(), out.end(), [](const v1::InstanceGroup& a, const v1::InstanceGroup& b) {
    const auto at = util::FromProto(a.created_at());
    const auto bt = util::FromProto(b.created_at());
    return at != bt ? at < bt : a.id() < b.id();
  });
  return out;
}

std::optional<v1::InstanceGroup> FleetStateTracker::Find(const std::string& group_id) const {
  std::shared_lock lock(mutex_);
  auto             it = groups_.find(group_id);
  if (it == groups_.end()) return std::nullopt;
  return it->second;
}

std::optional<v1::InstanceGroup> FleetStateTracker::ServingGroup(const std::string& service_name) const {
  const auto table = splitter_->GetWeights(service_name);

  std::shared_lock lock(mutex_);
  for (const auto& [id, weight] : table->weights) {
    if (weight != 100) continue;
    auto it = groups_.find(id);
    if (it != groups_.end() && model::IsLive(it->second.lifecycle_state())) return it->second;
  }
  return std::nullopt;
}

} // namespace rollout::fleet
