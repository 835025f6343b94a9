#pragma once

#include <memory>
#include <string>

#include "rollout/manager/v1.hpp"

namespace rollout::collab {

/*
  External artifact registry.

  Implementations throw util::NotFound for unknown coordinates and
  util::Unavailable for transient failures (retried by the resolver).
*/
class ArtifactRegistry {
 public:
  virtual ~ArtifactRegistry() = default;

  virtual rollout::manager::v1::ArtifactRef Resolve(const std::string& name, const std::string& version) = 0;
};

using ArtifactRegistryPtr = std::shared_ptr<ArtifactRegistry>;

} // namespace rollout::collab
