#pragma once

#include <memory>

#include "recording_notifier.hpp"
#include "sim_artifact_registry.hpp"
#include "sim_cluster_scheduler.hpp"
#include "sim_instance_prober.hpp"
#include "sim_metrics_source.hpp"

namespace rollout::runtime::config {
class SimulationConfig;
}

namespace rollout::collab::sim {

// One simulated copy of every external collaborator.
struct SimEnvironment {
  std::shared_ptr<SimArtifactRegistry> registry;
  std::shared_ptr<SimClusterScheduler> scheduler;
  std::shared_ptr<SimMetricsSource>    metrics;
  std::shared_ptr<SimInstanceProber>   prober;

  // Every rollout event the controller published, in delivery order.
  std::shared_ptr<RecordingNotifier> events;
};

SimEnvironment BuildSimEnvironment(const rollout::runtime::config::SimulationConfig& config);

} // namespace rollout::collab::sim
