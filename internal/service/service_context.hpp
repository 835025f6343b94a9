#pragma once

#include <memory>

namespace rollout::core {
class RolloutController;
}
namespace rollout::fleet {
class FleetStateTracker;
}
namespace rollout::traffic {
class TrafficSplitter;
}
namespace rollout::db {
class Repository;
}

namespace rollout::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<rollout::core::RolloutController> controller;
  std::shared_ptr<rollout::fleet::FleetStateTracker> fleet;
  std::shared_ptr<rollout::traffic::TrafficSplitter> splitter;
  std::shared_ptr<rollout::db::Repository>           repository;
};

} // namespace rollout::service
