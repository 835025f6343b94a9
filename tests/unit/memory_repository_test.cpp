#include "internal/db/memory/memory_repository.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

namespace v1 = rollout::manager::core::v1;

using rollout::db::ErrorCode;
using rollout::db::memory::MemoryRepository;
using rollout::db::model::HistoryRecord;
using rollout::db::model::LeaseRecord;
using rollout::db::model::RolloutRecord;

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
  r.body.mutable_request()->set_service_name(service);
  return r;
}

void TestUncommittedWritesAreDiscarded() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout("r-1", "checkout", "k-1", 10)));
    assert(repo.GetRollout(*tx, "r-1").has_value());
    // destructor rolls back
  }

  auto tx = repo.Begin();
  assert(!repo.GetRollout(*tx, "r-1").has_value());
  assert(!repo.FindRolloutByIdempotencyKey(*tx, "k-1").has_value());
  tx->Commit();
}

void TestDuplicateIdempotencyKeyIsRejected() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(repo.InsertRollout(*tx, MakeRollout("r-1", "checkout", "same", 10)));

  const auto dup = repo.InsertRollout(*tx, MakeRollout("r-2", "checkout", "same", 20));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  // empty keys are not indexed
  assert(repo.InsertRollout(*tx, MakeRollout("r-3", "search", "", 30)));
  assert(repo.InsertRollout(*tx, MakeRollout("r-4", "billing", "", 40)));
  tx->Commit();
}

void TestVersionedUpdateRejectsStaleWriter() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  auto             r  = MakeRollout("r-1", "checkout", "", 10);
  assert(repo.InsertRollout(*tx, r));

  r.version = 2;
  r.state   = v1::ROLLOUT_STATE_PROVISIONING;
  assert(repo.UpdateRollout(*tx, r, 1));

  r.version = 3;
  const auto stale = repo.UpdateRollout(*tx, r, 1);
  assert(stale.code == ErrorCode::Conflict);

  auto missing = MakeRollout("nope", "checkout", "", 10);
  assert(repo.UpdateRollout(*tx, missing, 1).code == ErrorCode::NotFound);

  const auto stored = repo.GetRollout(*tx, "r-1");
  assert(stored->version == 2);
  assert(stored->state == v1::ROLLOUT_STATE_PROVISIONING);
  tx->Commit();
}

void TestActiveRolloutAndListingOrder() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  auto done     = MakeRollout("r-old", "checkout", "", 5);
  done.terminal = true;
  done.state    = v1::ROLLOUT_STATE_PROMOTED;
  assert(repo.InsertRollout(*tx, done));
  assert(repo.InsertRollout(*tx, MakeRollout("r-new", "checkout", "", 50)));
  assert(repo.InsertRollout(*tx, MakeRollout("r-other", "search", "", 20)));

  const auto active = repo.FindActiveRollout(*tx, "checkout");
  assert(active.has_value());
  assert(active->id == "r-new");

  const auto live = repo.ListRollouts(*tx, "checkout", false);
  assert(live.size() == 1);

  const auto all = repo.ListRollouts(*tx, "", true);
  assert(all.size() == 3);
  assert(all[0].id == "r-old");
  assert(all[1].id == "r-other");
  assert(all[2].id == "r-new");
  tx->Commit();
}

void TestHistoryIsAppendOnlyAndOrdered() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  assert(repo.InsertRollout(*tx, MakeRollout("r-1", "checkout", "", 10)));

  for (uint64_t seq : {2u, 1u, 3u}) {
    HistoryRecord h;
    h.rollout_id = "r-1";
    h.seq        = seq;
    h.to_state   = v1::ROLLOUT_STATE_PENDING;
    assert(repo.AppendHistory(*tx, h));
  }

  HistoryRecord again;
  again.rollout_id = "r-1";
  again.seq        = 2;
  assert(repo.AppendHistory(*tx, again).code == ErrorCode::AlreadyExists);

  const auto history = repo.GetHistory(*tx, "r-1");
  assert(history.size() == 3);
  assert(history[0].seq == 1 && history[1].seq == 2 && history[2].seq == 3);
  tx->Commit();
}

void TestLeaseDeleteRequiresMatchingId() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  LeaseRecord lease{.service_name = "checkout", .lease_id = "lease-a", .holder_id = "c-1", .expires_at_ms = 100, .fencing_token = 1};
  assert(repo.UpsertLease(*tx, lease));

  assert(repo.DeleteLease(*tx, "checkout", "lease-b").code == ErrorCode::NotFound);
  assert(repo.GetLease(*tx, "checkout").has_value());
  assert(repo.DeleteLease(*tx, "checkout", "lease-a"));
  assert(!repo.GetLease(*tx, "checkout").has_value());
  tx->Commit();
}

void TestTransactionsAreSerialized() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertRollout(*tx, MakeRollout("r-1", "checkout", "", 10)));
    tx->Commit();
  }

  constexpr int kThreads    = 4;
  constexpr int kIncrements = 50;

  std::vector<std::thread> threads;
  std::atomic<int>         conflicts{0};
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIncrements; ++i) {
        auto tx      = repo.Begin();
        auto current = repo.GetRollout(*tx, "r-1");
        auto next    = *current;
        next.version = current->version + 1;
        if (!repo.UpdateRollout(*tx, next, current->version)) {
          conflicts.fetch_add(1);
        }
        tx->Commit();
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  auto tx = repo.Begin();
  assert(conflicts.load() == 0);
  assert(repo.GetRollout(*tx, "r-1")->version == 1 + kThreads * kIncrements);
  tx->Commit();
}

} // namespace

int main() {
  TestUncommittedWritesAreDiscarded();
  TestDuplicateIdempotencyKeyIsRejected();
  TestVersionedUpdateRejectsStaleWriter();
  TestActiveRolloutAndListingOrder();
  TestHistoryIsAppendOnlyAndOrdered();
  TestLeaseDeleteRequiresMatchingId();
  TestTransactionsAreSerialized();

  std::cout << "rollout_manager_unit_memory_repository: pass\n";
  return 0;
}
