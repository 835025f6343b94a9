#include "internal/lease/lease_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using rollout::db::memory::MemoryRepository;
using rollout::lease::LeaseManager;
using rollout::util::LeaseConflict;
using rollout::util::Millis;

template <typename Fn>
bool ThrowsLeaseConflict(Fn&& fn) {
  try {
    fn();
  } catch (const LeaseConflict&) {
    return true;
  }
  return false;
}

void TestSecondHolderIsRejectedWhileLeaseIsLive() {
  auto         repo = std::make_shared<MemoryRepository>();
  LeaseManager a(repo, "controller-a", Millis(60000));
  LeaseManager b(repo, "controller-b", Millis(60000));

  const auto lease = a.Acquire("checkout");
  assert(lease.holder_id == "controller-a");
  assert(lease.fencing_token == 1);

  assert(ThrowsLeaseConflict([&] { (void)b.Acquire("checkout"); }));

  // other services are independent
  const auto other = b.Acquire("search");
  assert(other.holder_id == "controller-b");
}

void TestExpiredLeaseIsTakenOverWithHigherFencingToken() {
  auto         repo = std::make_shared<MemoryRepository>();
  LeaseManager a(repo, "controller-a", Millis(20));
  LeaseManager b(repo, "controller-b", Millis(60000));

  const auto old_lease = a.Acquire("checkout");
  std::this_thread::sleep_for(std::chrono::milliseconds(40));

  {
    auto tx = repo->Begin();
    assert(b.IsExpired(*tx, "checkout"));
    tx->Commit();
  }

  const auto new_lease = b.Acquire("checkout");
  assert(new_lease.fencing_token == old_lease.fencing_token + 1);
  assert(new_lease.lease_id != old_lease.lease_id);

  // the previous holder can no longer commit or renew
  {
    auto tx = repo->Begin();
    assert(ThrowsLeaseConflict([&] { a.CheckHeld(*tx, old_lease); }));
    b.CheckHeld(*tx, new_lease);
    tx->Commit();
  }
  assert(ThrowsLeaseConflict([&] { (void)a.Renew(old_lease); }));
}

void TestSameHolderReacquiresItsOwnLease() {
  auto         repo = std::make_shared<MemoryRepository>();
  LeaseManager a(repo, "controller-a", Millis(60000));

  const auto first  = a.Acquire("checkout");
  const auto second = a.Acquire("checkout");
  assert(second.fencing_token == first.fencing_token + 1);
}

void TestRenewExtendsExpiry() {
  auto         repo = std::make_shared<MemoryRepository>();
  LeaseManager a(repo, "controller-a", Millis(1000));

  const auto lease = a.Acquire("checkout");
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const auto renewed = a.Renew(lease);

  assert(renewed.lease_id == lease.lease_id);
  assert(renewed.fencing_token == lease.fencing_token);
  assert(renewed.expires_at > lease.expires_at);
}

void TestReleaseIsIdempotent() {
  auto         repo = std::make_shared<MemoryRepository>();
  LeaseManager a(repo, "controller-a", Millis(60000));
  LeaseManager b(repo, "controller-b", Millis(60000));

  const auto lease = a.Acquire("checkout");
  a.Release(lease);
  a.Release(lease);

  auto tx = repo->Begin();
  assert(a.IsExpired(*tx, "checkout"));
  tx->Commit();

  const auto taken = b.Acquire("checkout");
  assert(taken.holder_id == "controller-b");
}

} // namespace

int main() {
  TestSecondHolderIsRejectedWhileLeaseIsLive();
  TestExpiredLeaseIsTakenOverWithHigherFencingToken();
  TestSameHolderReacquiresItsOwnLease();
  TestRenewExtendsExpiry();
  TestReleaseIsIdempotent();

  std::cout << "rollout_manager_unit_lease_manager: pass\n";
  return 0;
}
