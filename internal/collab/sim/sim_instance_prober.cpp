#include "sim_instance_prober.hpp"

namespace rollout::collab::sim {

namespace v1 = rollout::manager::v1;

bool SimInstanceProber::Healthy(const v1::InstanceGroup& group) const {
  const auto& version = group.artifact().version();
  if (unhealthy_versions_.contains(version) || unhealthy_groups_.contains(group.id())) {
    return false;
  }
  auto limit = replica_limit_.find(version);
  return limit == replica_limit_.end() || group.desired_replicas() < limit->second;
}

v1::ProbeResponse SimInstanceProber::Probe(const v1::InstanceGroup& group, const v1::ProbeRequest& request, const util::CancelToken& cancel) {
  util::Millis delay{0};
  bool         healthy = true;
  {
    std::lock_guard lock(mutex_);
    ++probes_;
    auto it = latency_.find(group.artifact().version());
    if (it != latency_.end()) delay = it->second;
    healthy = Healthy(group);
  }

  v1::ProbeResponse response;
  if (delay.count() > 0 && cancel.WaitFor(delay)) {
    response.set_reachable(false);
    return response;
  }

  response.set_reachable(true);
  if (!healthy) {
    response.set_status_code(503);
    response.set_body(R"({"status":"unavailable"})");
    return response;
  }

  response.set_status_code(200);
  if (request.kind() == v1::PROBE_KIND_SYNTHETIC) {
    response.set_body(R"({"status":"ok","version":")" + group.artifact().version() + R"(","path":")" + request.path() + "\"}");
  } else {
    response.set_body(R"({"status":"ok"})");
  }
  return response;
}

void SimInstanceProber::SetVersionHealthy(const std::string& version, bool healthy) {
  std::lock_guard lock(mutex_);
  if (healthy) {
    unhealthy_versions_.erase(version);
  } else {
    unhealthy_versions_.insert(version);
  }
}

void SimInstanceProber::SetGroupHealthy(const std::string& group_id, bool healthy) {
  std::lock_guard lock(mutex_);
  if (healthy) {
    unhealthy_groups_.erase(group_id);
  } else {
    unhealthy_groups_.insert(group_id);
  }
}

void SimInstanceProber::SetVersionLatency(const std::string& version, util::Millis delay) {
  std::lock_guard lock(mutex_);
  latency_[version] = delay;
}

void SimInstanceProber::FailWhenReplicasAtLeast(const std::string& version, uint32_t replicas) {
  std::lock_guard lock(mutex_);
  replica_limit_[version] = replicas;
}

uint64_t SimInstanceProber::ProbeCount() const {
  std::lock_guard lock(mutex_);
  return probes_;
}

} // namespace rollout::collab::sim
