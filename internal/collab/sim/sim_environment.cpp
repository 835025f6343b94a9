#include "sim_environment.hpp"

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace rollout::collab::sim {

SimEnvironment BuildSimEnvironment(const rollout::runtime::config::SimulationConfig& config) {
  SimEnvironment env;

  env.registry = std::make_shared<SimArtifactRegistry>();
  for (const auto& artifact : config.artifacts()) {
    rollout::manager::v1::ArtifactRef ref;
    ref.set_name(artifact.name());
    ref.set_version(artifact.version());
    ref.set_locator(artifact.locator().empty() ? "sim://" + artifact.name() + "@" + artifact.version() : artifact.locator());
    *ref.mutable_resource_spec() = artifact.resource_spec();
    if (ref.resource_spec().replicas() == 0) ref.mutable_resource_spec()->set_replicas(1);
    env.registry->Add(ref);
  }

  env.scheduler = std::make_shared<SimClusterScheduler>(util::FromProto(config.ready_delay()));

  MetricValues baseline(config.baseline_metrics().begin(), config.baseline_metrics().end());
  env.metrics = std::make_shared<SimMetricsSource>(std::move(baseline));

  env.prober = std::make_shared<SimInstanceProber>();
  return env;
}

} // namespace rollout::collab::sim
