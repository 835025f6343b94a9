#include "lease_manager.hpp"

#include "internal/db/api/result_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rollout::lease {

using observability::IntField;
using observability::StringField;

LeaseManager::LeaseManager(std::shared_ptr<db::Repository> repository, std::string holder_id, util::Millis ttl)
    : repository_(std::move(repository)), holder_id_(std::move(holder_id)), ttl_(ttl) {
}

Lease LeaseManager::ToLease(const db::model::LeaseRecord& record) {
  Lease lease;
  lease.service_name  = record.service_name;
  lease.lease_id      = record.lease_id;
  lease.holder_id     = record.holder_id;
  lease.fencing_token = record.fencing_token;
  lease.expires_at    = util::FromUnixMillis(record.expires_at_ms);
  return lease;
}

Lease LeaseManager::Acquire(db::Transaction& tx, const std::string& service_name) {
  const auto now      = util::NowMillis();
  const auto existing = repository_->GetLease(tx, service_name);

  if (existing && existing->holder_id != holder_id_ && existing->expires_at_ms > now) {
    throw util::LeaseConflict("service '" + service_name + "' is leased by controller " + existing->holder_id);
  }

  db::model::LeaseRecord record;
  record.service_name  = service_name;
  record.lease_id      = util::NewId("lease-");
  record.holder_id     = holder_id_;
  record.expires_at_ms = now + static_cast<uint64_t>(ttl_.count());
  record.fencing_token = existing ? existing->fencing_token + 1 : 1;

  db::ThrowIfDbError(repository_->UpsertLease(tx, record), "acquire lease");

  if (existing && existing->holder_id != holder_id_) {
    ROLLOUT_LOG_WARN("took over expired lease", {StringField("service", service_name), StringField("previous_holder", existing->holder_id),
                                                 IntField("fencing_token", static_cast<int64_t>(record.fencing_token))});
  }
  return ToLease(record);
}

Lease LeaseManager::Acquire(const std::string& service_name) {
  auto tx    = repository_->Begin();
  auto lease = Acquire(*tx, service_name);
  tx->Commit();
  return lease;
}

Lease LeaseManager::Renew(const Lease& lease) {
  auto tx = repository_->Begin();
  CheckHeld(*tx, lease);

  db::model::LeaseRecord record;
  record.service_name  = lease.service_name;
  record.lease_id      = lease.lease_id;
  record.holder_id     = lease.holder_id;
  record.fencing_token = lease.fencing_token;
  record.expires_at_ms = util::NowMillis() + static_cast<uint64_t>(ttl_.count());

  db::ThrowIfDbError(repository_->UpsertLease(*tx, record), "renew lease");
  tx->Commit();
  return ToLease(record);
}

void LeaseManager::Release(const Lease& lease) {
  auto tx = repository_->Begin();
  Release(*tx, lease);
  tx->Commit();
}

void LeaseManager::Release(db::Transaction& tx, const Lease& lease) {
  const auto result = repository_->DeleteLease(tx, lease.service_name, lease.lease_id);
  if (!result && result.code != db::ErrorCode::NotFound) {
    db::ThrowIfDbError(result, "release lease");
  }
}

void LeaseManager::CheckHeld(db::Transaction& tx, const Lease& lease) {
  const auto current = repository_->GetLease(tx, lease.service_name);
  if (!current || current->lease_id != lease.lease_id || current->fencing_token != lease.fencing_token) {
    throw util::LeaseConflict("lease " + lease.lease_id + " on service '" + lease.service_name + "' is no longer held");
  }
}

bool LeaseManager::IsExpired(db::Transaction& tx, const std::string& service_name) {
  const auto current = repository_->GetLease(tx, service_name);
  return !current || current->expires_at_ms <= util::NowMillis();
}

} // namespace rollout::lease
