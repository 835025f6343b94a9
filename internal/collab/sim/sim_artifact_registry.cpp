#include "sim_artifact_registry.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rollout::collab::sim {

rollout::manager::v1::ArtifactRef SimArtifactRegistry::Resolve(const std::string& name, const std::string& version) {
  std::lock_guard lock(mutex_);
  ++calls_;

  if (pending_failures_ > 0) {
    --pending_failures_;
    throw util::Unavailable("artifact registry unavailable");
  }

  auto it = artifacts_.find({name, version});
  if (it == artifacts_.end()) {
    throw util::NotFound("artifact not found: " + name + "@" + version);
  }
  return it->second;
}

void SimArtifactRegistry::Add(const rollout::manager::v1::ArtifactRef& artifact) {
  std::lock_guard lock(mutex_);
  auto stored = artifact;
  if (!stored.has_created_at()) {
    *stored.mutable_created_at() = util::ToProto(util::Now());
  }
  artifacts_[{artifact.name(), artifact.version()}] = std::move(stored);
}

void SimArtifactRegistry::FailNextResolves(uint32_t count) {
  std::lock_guard lock(mutex_);
  pending_failures_ = count;
}

uint64_t SimArtifactRegistry::ResolveCalls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

} // namespace rollout::collab::sim
