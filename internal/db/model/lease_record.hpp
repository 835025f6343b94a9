#pragma once

#include <cstdint>
#include <string>

namespace rollout::db::model {

/*
  Per-service controller lease.

  fencing_token increases on every acquisition; writes made under an older
  token are rejected by the lease check.
*/
struct LeaseRecord {
  std::string service_name;
  std::string lease_id;
  std::string holder_id;
  uint64_t    expires_at_ms = 0;
  uint64_t    fencing_token = 0;
};

} // namespace rollout::db::model
