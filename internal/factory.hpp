#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/collab/async_notifier.hpp"
#include "internal/collab/sim/sim_environment.hpp"
#include "internal/core/controller_watchdog.hpp"
#include "internal/core/rollout_controller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fleet/fleet_state_tracker.hpp"
#include "internal/fleet/teardown_scheduler.hpp"
#include "internal/runtime/task_queue.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/rollout_service.hpp"
#include "internal/traffic/traffic_splitter.hpp"

namespace rollout::factory {

/*
  Engine

  Owns all long-lived components of one controller process.
  Everything here lives until Stop().
*/
struct Engine {
  std::shared_ptr<db::Repository> repository;

  collab::sim::SimEnvironment           sim;
  std::shared_ptr<collab::AsyncNotifier> notifier;

  std::shared_ptr<traffic::TrafficSplitter>   splitter;
  std::shared_ptr<fleet::FleetStateTracker>   fleet;
  std::shared_ptr<fleet::TeardownScheduler>   teardown;
  std::shared_ptr<lease::LeaseManager>        leases;
  std::shared_ptr<core::RolloutController>    controller;
  std::shared_ptr<core::ControllerWatchdog>   watchdog;

  std::shared_ptr<service::RolloutService> rollout_service;
  std::shared_ptr<service::AdminService>   admin_service;

  // Health checks and teardowns get their own pools so a drive waiting
  // on a gate never starves the checks it waits for.
  std::shared_ptr<runtime::TaskQueue>  gate_queue;
  std::shared_ptr<runtime::WorkerPool> gate_pool;
  std::shared_ptr<runtime::TaskQueue>  background_queue;
  std::shared_ptr<runtime::WorkerPool> background_pool;

  void Start();
  void Stop();
};

/*
  BuildRepository

  Selects the backend from the config oneof and bootstraps its schema.
  The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const rollout::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire controller from runtime config. `repository`
  overrides the configured backend and `sim` the simulated
  collaborators; tests pass both in to run several controllers over the
  same store and the same cluster.
*/
Engine Build(const rollout::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository = nullptr,
             const collab::sim::SimEnvironment* sim = nullptr);

} // namespace rollout::factory
