#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "internal/collab/artifact_registry.hpp"
#include "internal/util/cancel_token.hpp"
#include "internal/util/retry.hpp"

namespace rollout::artifact {

/*
  Turns a (name, version) coordinate into an immutable ArtifactRef.

  Transient registry failures are retried with backoff. The returned
  reference is checked for a locator and a positive replica count before
  it is accepted; anything else is util::ArtifactInvalid. References are
  immutable, so successful resolutions are cached.
*/
class ArtifactResolver {
 public:
  ArtifactResolver(collab::ArtifactRegistryPtr registry, util::RetryPolicy retry);

  rollout::manager::v1::ArtifactRef Resolve(const rollout::manager::v1::ArtifactCoordinate& coordinate,
                                            const util::CancelToken*                        cancel = nullptr);

 private:
  static void Validate(const rollout::manager::v1::ArtifactCoordinate& coordinate, const rollout::manager::v1::ArtifactRef& ref);

  collab::ArtifactRegistryPtr registry_;
  util::RetryPolicy           retry_;

  std::mutex                                                                cache_mutex_;
  std::map<std::pair<std::string, std::string>, rollout::manager::v1::ArtifactRef> cache_;
};

} // namespace rollout::artifact
