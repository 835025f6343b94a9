#include "internal/fleet/fleet_state_tracker.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/collab/sim/sim_cluster_scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = rollout::manager::v1;

using rollout::collab::sim::SimClusterScheduler;
using rollout::db::memory::MemoryRepository;
using rollout::fleet::FleetStateTracker;
using rollout::traffic::TrafficSplitter;

struct Fixture {
  std::shared_ptr<MemoryRepository>    repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<SimClusterScheduler> scheduler  = std::make_shared<SimClusterScheduler>();
  std::shared_ptr<TrafficSplitter>     splitter   = std::make_shared<TrafficSplitter>(repository);
  FleetStateTracker                    fleet{repository, scheduler, splitter};
};

v1::InstanceGroup MakeGroup(const std::string& id, const std::string& service, const std::string& version, uint32_t replicas) {
  v1::InstanceGroup group;
  group.set_id(id);
  group.set_service_name(service);
  group.mutable_artifact()->set_name(service);
  group.mutable_artifact()->set_version(version);
  group.set_desired_replicas(replicas);
  return group;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestRegisterIsIdempotentAndStartsProvisioning() {
  Fixture f;
  const auto first = f.fleet.Register(MakeGroup("g-1", "checkout", "1.0", 3));
  assert(first.lifecycle_state() == v1::LIFECYCLE_STATE_PROVISIONING);
  assert(first.traffic_weight() == 0);

  auto changed = MakeGroup("g-1", "checkout", "9.9", 7);
  const auto again = f.fleet.Register(changed);
  assert(again.artifact().version() == "1.0");
  assert(again.desired_replicas() == 3);

  assert(Throws<rollout::util::AlreadyExists>([&] { f.fleet.Register(MakeGroup("g-1", "search", "1.0", 1)); }));
  assert(Throws<rollout::util::InvalidArgument>([&] { f.fleet.Register(MakeGroup("", "checkout", "1.0", 1)); }));
}

void TestReadinessPromotesOnlyWhenAllReplicasReady() {
  Fixture f;
  f.fleet.Register(MakeGroup("g-1", "checkout", "1.0", 3));

  assert(f.fleet.UpdateReadiness("g-1", 2).lifecycle_state() == v1::LIFECYCLE_STATE_PROVISIONING);
  const auto ready = f.fleet.UpdateReadiness("g-1", 5);
  assert(ready.ready_replicas() == 3);
  assert(ready.lifecycle_state() == v1::LIFECYCLE_STATE_READY);
}

void TestLifecycleNeverRegresses() {
  Fixture f;
  f.fleet.Register(MakeGroup("g-1", "checkout", "1.0", 1));
  f.fleet.SetLifecycle("g-1", v1::LIFECYCLE_STATE_READY);
  f.fleet.SetLifecycle("g-1", v1::LIFECYCLE_STATE_SERVING);

  assert(Throws<rollout::util::InvalidState>([&] { f.fleet.SetLifecycle("g-1", v1::LIFECYCLE_STATE_READY); }));

  f.fleet.SetLifecycle("g-1", v1::LIFECYCLE_STATE_TERMINATED);
  assert(Throws<rollout::util::InvalidState>([&] { f.fleet.SetLifecycle("g-1", v1::LIFECYCLE_STATE_ABORTED); }));
  assert(Throws<rollout::util::NotFound>([&] { f.fleet.SetLifecycle("missing", v1::LIFECYCLE_STATE_READY); }));
}

void TestRefreshDetectsUnexpectedTermination() {
  Fixture f;
  v1::InstanceGroupSpec spec;
  spec.set_service_name("checkout");
  spec.mutable_artifact()->set_version("1.0");
  spec.set_replicas(2);
  const auto id = f.scheduler->CreateInstanceGroup(spec);

  f.fleet.Register(MakeGroup(id, "checkout", "1.0", 2));
  assert(f.fleet.RefreshReadiness(id).lifecycle_state() == v1::LIFECYCLE_STATE_READY);

  f.scheduler->Kill(id);
  assert(Throws<rollout::util::UnexpectedTermination>([&] { f.fleet.RefreshReadiness(id); }));
}

void TestSetWeightRedistributesRemainder() {
  Fixture f;
  f.fleet.Register(MakeGroup("blue", "checkout", "1.0", 2));
  f.fleet.Register(MakeGroup("green", "checkout", "2.0", 2));

  // sole group must take all or nothing
  assert(Throws<rollout::util::InvalidArgument>([&] { f.fleet.SetWeight("checkout", "blue", 40); }));

  f.fleet.SetWeight("checkout", "blue", 100);
  const auto split = f.fleet.SetWeight("checkout", "green", 10);
  assert(split->WeightOf("green") == 10);
  assert(split->WeightOf("blue") == 90);

  assert(f.fleet.Find("blue")->traffic_weight() == 90);
  assert(f.fleet.Find("green")->traffic_weight() == 10);
  assert(!f.fleet.ServingGroup("checkout").has_value());

  f.fleet.SetWeight("checkout", "green", 100);
  assert(f.fleet.ServingGroup("checkout")->id() == "green");
  assert(f.fleet.Find("blue")->traffic_weight() == 0);
}

void TestTerminatedGroupsCannotReceiveTraffic() {
  Fixture f;
  f.fleet.Register(MakeGroup("blue", "checkout", "1.0", 1));
  f.fleet.Register(MakeGroup("green", "checkout", "2.0", 1));
  f.fleet.SetWeights("checkout", {{"blue", 100}});
  f.fleet.SetLifecycle("green", v1::LIFECYCLE_STATE_TERMINATED);

  assert(Throws<rollout::util::InvalidState>([&] { f.fleet.SetWeights("checkout", {{"green", 100}}); }));
  assert(Throws<rollout::util::InvalidState>([&] { f.fleet.SetMirror("checkout", "green", true); }));
  assert(Throws<rollout::util::InvalidArgument>([&] { f.fleet.SetWeights("search", {{"blue", 100}}); }));

  assert(f.fleet.Get("checkout").size() == 1);
  assert(f.fleet.List("checkout", true).size() == 2);
}

void TestHydrateReloadsGroups() {
  auto repository = std::make_shared<MemoryRepository>();
  auto scheduler  = std::make_shared<SimClusterScheduler>();
  auto splitter   = std::make_shared<TrafficSplitter>(repository);
  {
    FleetStateTracker fleet(repository, scheduler, splitter);
    fleet.Register(MakeGroup("blue", "checkout", "1.0", 2));
    fleet.SetLifecycle("blue", v1::LIFECYCLE_STATE_SERVING);
    fleet.SetWeights("checkout", {{"blue", 100}});
  }

  auto              reloaded_splitter = std::make_shared<TrafficSplitter>(repository);
  FleetStateTracker fleet(repository, scheduler, reloaded_splitter);
  reloaded_splitter->Hydrate();
  fleet.Hydrate();

  const auto serving = fleet.ServingGroup("checkout");
  assert(serving.has_value());
  assert(serving->id() == "blue");
  assert(serving->lifecycle_state() == v1::LIFECYCLE_STATE_SERVING);
  assert(serving->traffic_weight() == 100);
}

} // namespace

int main() {
  TestRegisterIsIdempotentAndStartsProvisioning();
  TestReadinessPromotesOnlyWhenAllReplicasReady();
  TestLifecycleNeverRegresses();
  TestRefreshDetectsUnexpectedTermination();
  TestSetWeightRedistributesRemainder();
  TestTerminatedGroupsCannotReceiveTraffic();
  TestHydrateReloadsGroups();

  std::cout << "rollout_manager_unit_fleet_state_tracker: pass\n";
  return 0;
}
