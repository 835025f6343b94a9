#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "internal/collab/artifact_registry.hpp"

namespace rollout::collab::sim {

// In-process registry seeded from configuration or by tests.
class SimArtifactRegistry final : public ArtifactRegistry {
 public:
  rollout::manager::v1::ArtifactRef Resolve(const std::string& name, const std::string& version) override;

  void Add(const rollout::manager::v1::ArtifactRef& artifact);

  // The next `count` resolves throw util::Unavailable.
  void FailNextResolves(uint32_t count);

  uint64_t ResolveCalls() const;

 private:
  using Key = std::pair<std::string, std::string>;

  mutable std::mutex                                mutex_;
  std::map<Key, rollout::manager::v1::ArtifactRef> artifacts_;
  uint32_t                                          pending_failures_ = 0;
  uint64_t                                          calls_            = 0;
};

} // namespace rollout::collab::sim
