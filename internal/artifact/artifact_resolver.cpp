#include "artifact_resolver.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rollout::artifact {

namespace v1 = rollout::manager::v1;

ArtifactResolver::ArtifactResolver(collab::ArtifactRegistryPtr registry, util::RetryPolicy retry)
    : registry_(std::move(registry)), retry_(retry) {
}

v1::ArtifactRef ArtifactResolver::Resolve(const v1::ArtifactCoordinate& coordinate, const util::CancelToken* cancel) {
  if (coordinate.name().empty() || coordinate.version().empty()) {
    throw util::InvalidArgument("artifact name and version are required");
  }

  const auto key = std::make_pair(coordinate.name(), coordinate.version());
  {
    std::lock_guard lock(cache_mutex_);
    auto            it = cache_.find(key);
    if (it != cache_.end()) return it->second;
  }

  auto ref = util::RetryTransient(
      retry_, "artifact.resolve", [&] { return registry_->Resolve(coordinate.name(), coordinate.version()); }, cancel);

  Validate(coordinate, ref);

  ROLLOUT_LOG_INFO("artifact resolved", {observability::StringField("artifact", coordinate.name() + "@" + coordinate.version()),
                                         observability::StringField("locator", ref.locator()),
                                         observability::IntField("replicas", ref.resource_spec().replicas())});

  std::lock_guard lock(cache_mutex_);
  cache_.emplace(key, ref);
  return ref;
}

void ArtifactResolver::Validate(const v1::ArtifactCoordinate& coordinate, const v1::ArtifactRef& ref) {
  const auto label = coordinate.name() + "@" + coordinate.version();

  if (ref.name() != coordinate.name() || ref.version() != coordinate.version()) {
    throw util::ArtifactInvalid("registry returned " + ref.name() + "@" + ref.version() + " for " + label);
  }
  if (ref.locator().empty()) {
    throw util::ArtifactInvalid("artifact " + label + " has no locator");
  }
  if (ref.resource_spec().replicas() == 0) {
    throw util::ArtifactInvalid("artifact " + label + " requests zero replicas");
  }
}

} // namespace rollout::artifact
