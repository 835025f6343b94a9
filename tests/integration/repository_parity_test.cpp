#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

namespace v1 = rollout::manager::v1;

using rollout::db::ErrorCode;
using rollout::db::Repository;
using rollout::db::model::HistoryRecord;
using rollout::db::model::InstanceGroupRecord;
using rollout::db::model::LeaseRecord;
using rollout::db::model::RolloutRecord;
using rollout::db::model::TrafficTableRecord;

struct BackendFactory {
  std::string                                 name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  bool                                        supports_restart = false;
  std::function<std::shared_ptr<Repository>()> restart;
  std::function<void()>                       cleanup;
};

uint64_t NowMs() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

// Postgres keeps rows between runs, so every run works under its own names.
std::string RunPrefix(const std::string& backend) {
  return backend + "-" + std::to_string(NowMs());
}

RolloutRecord MakeRollout(const std::string& id, const std::string& service, const std::string& key, uint64_t created_at_ms) {
  RolloutRecord r;
  r.id              = id;
  r.service_name    = service;
  r.idempotency_key = key;
  r.state           = v1::ROLLOUT_STATE_PENDING;
  r.version         = 1;
  r.created_at_ms   = created_at_ms;
  r.updated_at_ms   = created_at_ms;

  r.body.set_id(id);
  r.body.set_state(v1::ROLLOUT_STATE_PENDING);
  auto* request = r.body.mutable_request();
  request->set_service_name(service);
  request->mutable_target_artifact()->set_name(service);
  request->mutable_target_artifact()->set_version("2.0.0");
  request->set_strategy(v1::STRATEGY_CANARY);
  request->set_idempotency_key(key);
  return r;
}

HistoryRecord MakeHistory(const std::string& rollout_id, uint64_t seq, v1::RolloutState from, v1::RolloutState to, v1::ReasonCode reason) {
  HistoryRecord h;
  h.rollout_id = rollout_id;
  h.seq        = seq;
  h.from_state = from;
  h.to_state   = to;
  h.reason     = reason;
  h.diagnostic = "step " + std::to_string(seq);
  h.at_ms      = NowMs();
  return h;
}

void VerifyRolloutLifecycle(Repository& repo, const std::string& prefix) {
  const auto service = prefix + "-checkout";
  const auto id      = prefix + "-ro-1";
  const auto key     = prefix + "-key-1";
  const auto now     = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout(id, service, key, now)));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetRollout(*tx, id);
    assert(stored.has_value());
    assert(stored->service_name == service);
    assert(stored->idempotency_key == key);
    assert(stored->state == v1::ROLLOUT_STATE_PENDING);
    assert(!stored->terminal);
    assert(stored->version == 1);
    assert(stored->body.request().target_artifact().version() == "2.0.0");
    assert(stored->body.request().strategy() == v1::STRATEGY_CANARY);

    auto by_key = repo.FindRolloutByIdempotencyKey(*tx, key);
    assert(by_key.has_value() && by_key->id == id);

    auto active = repo.FindActiveRollout(*tx, service);
    assert(active.has_value() && active->id == id);

    assert(!repo.GetRollout(*tx, prefix + "-missing").has_value());
    assert(!repo.FindRolloutByIdempotencyKey(*tx, prefix + "-no-such-key").has_value());
    tx->Commit();
  }

  // duplicate id and duplicate idempotency key are both rejected
  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertRollout(*tx, MakeRollout(id, service, prefix + "-key-other", now));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertRollout(*tx, MakeRollout(prefix + "-ro-other", service, key, now));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  // versioned update
  {
    auto tx     = repo.Begin();
    auto record = *repo.GetRollout(*tx, id);
    record.state   = v1::ROLLOUT_STATE_SOAKING;
    record.version = 2;
    record.body.set_state(v1::ROLLOUT_STATE_SOAKING);
    record.body.set_current_step(1);
    assert(repo.UpdateRollout(*tx, record, 1));
    tx->Commit();
  }
  {
    auto tx    = repo.Begin();
    auto stale = *repo.GetRollout(*tx, id);
    assert(stale.version == 2);
    assert(stale.state == v1::ROLLOUT_STATE_SOAKING);
    assert(stale.body.current_step() == 1);

    stale.version = 3;
    auto conflict = repo.UpdateRollout(*tx, stale, 1);
    assert(!conflict);
    assert(conflict.code == ErrorCode::Conflict);

    auto missing = MakeRollout(prefix + "-ro-missing", service, prefix + "-key-missing", now);
    auto result  = repo.UpdateRollout(*tx, missing, 1);
    assert(!result);
    assert(result.code == ErrorCode::NotFound);
    tx->Rollback();
  }

  // terminal rollouts drop out of the active views
  {
    auto tx     = repo.Begin();
    auto record = *repo.GetRollout(*tx, id);
    record.state    = v1::ROLLOUT_STATE_PROMOTED;
    record.terminal = true;
    record.version  = 3;
    record.body.set_state(v1::ROLLOUT_STATE_PROMOTED);
    assert(repo.UpdateRollout(*tx, record, 2));
    assert(repo.InsertRollout(*tx, MakeRollout(prefix + "-ro-2", service, prefix + "-key-2", now + 10)));
    tx->Commit();
  }
  {
    auto tx     = repo.Begin();
    auto active = repo.FindActiveRollout(*tx, service);
    assert(active.has_value() && active->id == prefix + "-ro-2");

    auto live = repo.ListRollouts(*tx, service, false);
    assert(live.size() == 1);
    assert(live[0].id == prefix + "-ro-2");

    auto all = repo.ListRollouts(*tx, service, true);
    assert(all.size() == 2);
    assert(all[0].id == id);
    assert(all[1].id == prefix + "-ro-2");
    assert(all[0].terminal);

    auto everything = repo.ListRollouts(*tx, "", true);
    assert(std::count_if(everything.begin(), everything.end(), [&](const RolloutRecord& r) { return r.service_name == service; }) == 2);

    assert(repo.ListRollouts(*tx, prefix + "-unknown", true).empty());
    tx->Commit();
  }
}

void VerifyHistory(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-ro-history";
  {
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout(id, prefix + "-history", prefix + "-key-history", NowMs())));
    // appended out of order on purpose; reads come back ordered by seq
    assert(repo.AppendHistory(
        *tx, MakeHistory(id, 2, v1::ROLLOUT_STATE_PROVISIONING, v1::ROLLOUT_STATE_VALIDATING, v1::REASON_CODE_GROUP_READY)));
    assert(repo.AppendHistory(
        *tx, MakeHistory(id, 1, v1::ROLLOUT_STATE_PENDING, v1::ROLLOUT_STATE_PROVISIONING, v1::REASON_CODE_ARTIFACT_RESOLVED)));
    assert(repo.AppendHistory(
        *tx, MakeHistory(id, 0, v1::ROLLOUT_STATE_UNSPECIFIED, v1::ROLLOUT_STATE_PENDING, v1::REASON_CODE_ACCEPTED)));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto history = repo.GetHistory(*tx, id);
    assert(history.size() == 3);
    for (size_t i = 0; i < history.size(); ++i) {
      assert(history[i].seq == i);
      assert(history[i].rollout_id == id);
    }
    assert(history[0].to_state == v1::ROLLOUT_STATE_PENDING);
    assert(history[0].reason == v1::REASON_CODE_ACCEPTED);
    assert(history[2].from_state == v1::ROLLOUT_STATE_PROVISIONING);
    assert(history[2].reason == v1::REASON_CODE_GROUP_READY);
    assert(history[2].diagnostic == "step 2");

    auto dup = repo.AppendHistory(*tx, MakeHistory(id, 1, v1::ROLLOUT_STATE_PENDING, v1::ROLLOUT_STATE_FAILED, v1::REASON_CODE_INTERNAL_ERROR));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.GetHistory(*tx, id).size() == 3);
    assert(repo.GetHistory(*tx, prefix + "-no-history").empty());
    tx->Commit();
  }
}

void VerifyInstanceGroups(Repository& repo, const std::string& prefix) {
  const auto service = prefix + "-groups";

  auto make = [&](const std::string& id, v1::LifecycleState state, uint32_t replicas) {
    InstanceGroupRecord r;
    r.id              = id;
    r.service_name    = service;
    r.lifecycle_state = state;
    r.updated_at_ms   = NowMs();
    r.body.set_id(id);
    r.body.set_service_name(service);
    r.body.mutable_artifact()->set_name(service);
    r.body.mutable_artifact()->set_version("1.0.0");
    r.body.set_desired_replicas(replicas);
    r.body.set_lifecycle_state(state);
    return r;
  };

  {
    auto tx = repo.Begin();
    assert(repo.UpsertInstanceGroup(*tx, make(prefix + "-ig-1", v1::LIFECYCLE_STATE_PROVISIONING, 3)));
    assert(repo.UpsertInstanceGroup(*tx, make(prefix + "-ig-2", v1::LIFECYCLE_STATE_SERVING, 2)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpsertInstanceGroup(*tx, make(prefix + "-ig-1", v1::LIFECYCLE_STATE_READY, 4)));
    tx->Commit();
  }
  {
    auto tx    = repo.Begin();
    auto group = repo.GetInstanceGroup(*tx, prefix + "-ig-1");
    assert(group.has_value());
    assert(group->lifecycle_state == v1::LIFECYCLE_STATE_READY);
    assert(group->body.desired_replicas() == 4);
    assert(group->body.artifact().version() == "1.0.0");

    auto groups = repo.ListInstanceGroups(*tx, service);
    assert(groups.size() == 2);

    auto all = repo.ListInstanceGroups(*tx, "");
    assert(std::count_if(all.begin(), all.end(), [&](const InstanceGroupRecord& g) { return g.service_name == service; }) == 2);

    assert(!repo.GetInstanceGroup(*tx, prefix + "-ig-missing").has_value());
    assert(repo.ListInstanceGroups(*tx, prefix + "-unknown").empty());
    tx->Commit();
  }
}

void VerifyTrafficTables(Repository& repo, const std::string& prefix) {
  const auto service = prefix + "-traffic";

  TrafficTableRecord table;
  table.service_name = service;
  table.version      = 1;
  table.body.set_service_name(service);
  table.body.set_version(1);
  (*table.body.mutable_weights())["ig-a"] = 100;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertTrafficTable(*tx, table));
    tx->Commit();
  }

  table.version = 2;
  table.body.set_version(2);
  (*table.body.mutable_weights())["ig-a"] = 90;
  (*table.body.mutable_weights())["ig-b"] = 10;
  table.body.add_mirrors("ig-c");
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTrafficTable(*tx, table));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetTrafficTable(*tx, service);
    assert(stored.has_value());
    assert(stored->version == 2);
    assert(stored->body.weights().size() == 2);
    assert(stored->body.weights().at("ig-a") == 90);
    assert(stored->body.weights().at("ig-b") == 10);
    assert(stored->body.mirrors_size() == 1);

    auto tables = repo.ListTrafficTables(*tx);
    assert(std::any_of(tables.begin(), tables.end(), [&](const TrafficTableRecord& t) { return t.service_name == service; }));

    assert(!repo.GetTrafficTable(*tx, prefix + "-unknown").has_value());
    tx->Commit();
  }
}

void VerifyLeases(Repository& repo, const std::string& prefix) {
  const auto service = prefix + "-leases";

  LeaseRecord lease;
  lease.service_name  = service;
  lease.lease_id      = prefix + "-lease-1";
  lease.holder_id     = "ctl-a";
  lease.expires_at_ms = NowMs() + 30000;
  lease.fencing_token = 1;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertLease(*tx, lease));
    tx->Commit();
  }

  // a takeover replaces the row and bumps the fencing token
  lease.lease_id      = prefix + "-lease-2";
  lease.holder_id     = "ctl-b";
  lease.fencing_token = 2;
  {
    auto tx = repo.Begin();
    assert(repo.UpsertLease(*tx, lease));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetLease(*tx, service);
    assert(stored.has_value());
    assert(stored->lease_id == prefix + "-lease-2");
    assert(stored->holder_id == "ctl-b");
    assert(stored->fencing_token == 2);
    assert(stored->expires_at_ms == lease.expires_at_ms);

    auto leases = repo.ListLeases(*tx);
    assert(std::any_of(leases.begin(), leases.end(), [&](const LeaseRecord& l) { return l.service_name == service; }));

    auto stale = repo.DeleteLease(*tx, service, prefix + "-lease-1");
    assert(!stale);
    assert(stale.code == ErrorCode::NotFound);

    assert(repo.DeleteLease(*tx, service, prefix + "-lease-2"));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetLease(*tx, service).has_value());
    tx->Commit();
  }
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-ro-discarded";
  {
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout(id, prefix + "-discard", prefix + "-key-discarded", NowMs())));
    assert(repo.GetRollout(*tx, id).has_value());
    tx->Rollback();
  }
  {
    // never committed and never rolled back explicitly
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout(id, prefix + "-discard", prefix + "-key-discarded", NowMs())));
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetRollout(*tx, id).has_value());
    assert(!repo.FindRolloutByIdempotencyKey(*tx, prefix + "-key-discarded").has_value());
    tx->Commit();
  }
}

void VerifyRestartDurability(const BackendFactory& factory, const std::string& prefix) {
  const auto id = prefix + "-ro-durable";
  {
    auto repo = factory.make_repository();
    auto tx   = repo->Begin();
    assert(repo->InsertRollout(*tx, MakeRollout(id, prefix + "-durable", prefix + "-key-durable", NowMs())));
    assert(repo->AppendHistory(
        *tx, MakeHistory(id, 0, v1::ROLLOUT_STATE_UNSPECIFIED, v1::ROLLOUT_STATE_PENDING, v1::REASON_CODE_ACCEPTED)));
    tx->Commit();
  }

  auto reopened = factory.restart();
  auto tx       = reopened->Begin();
  auto stored   = reopened->GetRollout(*tx, id);
  assert(stored.has_value());
  assert(stored->body.request().idempotency_key() == prefix + "-key-durable");
  assert(reopened->GetHistory(*tx, id).size() == 1);
  tx->Commit();
}

void RunBackendSuite(const BackendFactory& factory) {
  const auto prefix = RunPrefix(factory.name);

  {
    auto repo = factory.make_repository();
    VerifyRolloutLifecycle(*repo, prefix);
    VerifyHistory(*repo, prefix);
    VerifyInstanceGroups(*repo, prefix);
    VerifyTrafficTables(*repo, prefix);
    VerifyLeases(*repo, prefix);
    VerifyRollbackDiscardsWrites(*repo, prefix);
  }

  if (factory.supports_restart) {
    VerifyRestartDurability(factory, prefix);
  }

  if (factory.cleanup) {
    factory.cleanup();
  }

  std::cout << "  backend " << factory.name << ": ok\n";
}

BackendFactory MakeMemoryFactory() {
  BackendFactory f;
  f.name            = "memory";
  f.make_repository = [] { return std::make_shared<rollout::db::memory::MemoryRepository>(); };
  return f;
}

#if ROLLOUT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto path = (std::filesystem::temp_directory_path() / ("rollout_parity_" + std::to_string(NowMs()) + ".db")).string();

  rollout::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);

  BackendFactory f;
  f.name             = "sqlite";
  f.make_repository  = [config] { return rollout::factory::BuildRepository(config); };
  f.supports_restart = true;
  // reopening the file re-runs the idempotent schema bootstrap
  f.restart = [config] { return rollout::factory::BuildRepository(config); };
  f.cleanup = [path] {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + "-wal", ec);
    std::filesystem::remove(path + "-shm", ec);
  };
  return f;
}
#endif

#if ROLLOUT_DB_POSTGRES
bool MakePostgresFactory(BackendFactory* out) {
  const char* uri = std::getenv("ROLLOUT_TEST_POSTGRES_URI");
  if (uri == nullptr || *uri == '\0') {
    std::cout << "  backend postgres: skipped (ROLLOUT_TEST_POSTGRES_URI not set)\n";
    return false;
  }

  rollout::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_max_connections(4);

  out->name             = "postgres";
  out->make_repository  = [config] { return rollout::factory::BuildRepository(config); };
  out->supports_restart = true;
  out->restart          = [config] { return rollout::factory::BuildRepository(config); };
  return true;
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if ROLLOUT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if ROLLOUT_DB_POSTGRES
  BackendFactory postgres;
  if (MakePostgresFactory(&postgres)) backends.push_back(std::move(postgres));
#endif

  for (const auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "rollout_manager_integration_repository_parity: pass\n";
  return 0;
}
