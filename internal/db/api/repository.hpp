#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/instance_group_record.hpp"
#include "internal/db/model/lease_record.hpp"
#include "internal/db/model/rollout_record.hpp"
#include "internal/db/model/traffic_table_record.hpp"

namespace rollout::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - UpdateRollout is a compare-and-swap on the stored version
  - History rows are insert-only

  The DB is the source of truth for:
    rollout state + history (audit log)
    instance groups
    traffic tables
    service leases
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Rollouts
  // ---------------------------------------------------------------------

  // AlreadyExists on duplicate id or idempotency key.
  virtual Result InsertRollout(Transaction&, const model::RolloutRecord&) = 0;

  // Conflict when the stored version differs from expected_version.
  virtual Result UpdateRollout(Transaction&, const model::RolloutRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::RolloutRecord> GetRollout(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::RolloutRecord> FindRolloutByIdempotencyKey(Transaction&, const std::string& key) = 0;

  // The non-terminal rollout for a service, if any.
  virtual std::optional<model::RolloutRecord> FindActiveRollout(Transaction&, const std::string& service_name) = 0;

  // Empty service_name lists every service. Ordered by creation time.
  virtual std::vector<model::RolloutRecord> ListRollouts(Transaction&, const std::string& service_name, bool include_terminal) = 0;

  // ---------------------------------------------------------------------
  // History (append-only)
  // ---------------------------------------------------------------------

  virtual Result AppendHistory(Transaction&, const model::HistoryRecord&) = 0;

  // Ordered by seq.
  virtual std::vector<model::HistoryRecord> GetHistory(Transaction&, const std::string& rollout_id) = 0;

  // ---------------------------------------------------------------------
  // Instance groups
  // ---------------------------------------------------------------------

  virtual Result UpsertInstanceGroup(Transaction&, const model::InstanceGroupRecord&) = 0;

  virtual std::optional<model::InstanceGroupRecord> GetInstanceGroup(Transaction&, const std::string& id) = 0;

  // Empty service_name lists every service.
  virtual std::vector<model::InstanceGroupRecord> ListInstanceGroups(Transaction&, const std::string& service_name) = 0;

  // ---------------------------------------------------------------------
  // Traffic tables
  // ---------------------------------------------------------------------

  virtual Result UpsertTrafficTable(Transaction&, const model::TrafficTableRecord&) = 0;

  virtual std::optional<model::TrafficTableRecord> GetTrafficTable(Transaction&, const std::string& service_name) = 0;

  virtual std::vector<model::TrafficTableRecord> ListTrafficTables(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Service leases
  // ---------------------------------------------------------------------

  virtual Result UpsertLease(Transaction&, const model::LeaseRecord&) = 0;

  virtual std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string& service_name) = 0;

  // NotFound unless the stored lease has this lease_id.
  virtual Result DeleteLease(Transaction&, const std::string& service_name, const std::string& lease_id) = 0;

  virtual std::vector<model::LeaseRecord> ListLeases(Transaction&) = 0;
};

} // namespace rollout::db
