#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "lease.hpp"

namespace rollout::lease {

/*
  Per-service leases stored in the repository so every controller sharing
  the database sees the same owner.

  - Acquire fails with util::LeaseConflict while another holder's lease is
    unexpired. An expired lease is taken over and its fencing token bumped.
  - CheckHeld is called inside every rollout write transaction; a controller
    whose lease was taken over can no longer commit.
*/
class LeaseManager {
 public:
  LeaseManager(std::shared_ptr<db::Repository> repository, std::string holder_id, util::Millis ttl);

  Lease Acquire(db::Transaction& tx, const std::string& service_name);
  Lease Acquire(const std::string& service_name);

  // Extends the lease; throws util::LeaseConflict if it was lost.
  Lease Renew(const Lease& lease);

  // Drops the lease if still held. Losing it first is not an error.
  void Release(const Lease& lease);
  void Release(db::Transaction& tx, const Lease& lease);

  void CheckHeld(db::Transaction& tx, const Lease& lease);

  // True when the service has no lease or it is past expiry.
  bool IsExpired(db::Transaction& tx, const std::string& service_name);

  const std::string& HolderId() const {
    return holder_id_;
  }

  util::Millis Ttl() const {
    return ttl_;
  }

 private:
  static Lease ToLease(const db::model::LeaseRecord& record);

  std::shared_ptr<db::Repository> repository_;
  std::string                     holder_id_;
  util::Millis                    ttl_;
};

} // namespace rollout::lease
