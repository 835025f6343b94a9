#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rollout::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertRollout(Transaction&, const model::RolloutRecord&) override;
  Result                              UpdateRollout(Transaction&, const model::RolloutRecord&, uint64_t expected_version) override;
  std::optional<model::RolloutRecord> GetRollout(Transaction&, const std::string& id) override;
  std::optional<model::RolloutRecord> FindRolloutByIdempotencyKey(Transaction&, const std::string& key) override;
  std::optional<model::RolloutRecord> FindActiveRollout(Transaction&, const std::string& service_name) override;
  std::vector<model::RolloutRecord>   ListRollouts(Transaction&, const std::string& service_name, bool include_terminal) override;

  Result                             AppendHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> GetHistory(Transaction&, const std::string& rollout_id) override;

  Result                                    UpsertInstanceGroup(Transaction&, const model::InstanceGroupRecord&) override;
  std::optional<model::InstanceGroupRecord> GetInstanceGroup(Transaction&, const std::string& id) override;
  std::vector<model::InstanceGroupRecord>   ListInstanceGroups(Transaction&, const std::string& service_name) override;

  Result                                   UpsertTrafficTable(Transaction&, const model::TrafficTableRecord&) override;
  std::optional<model::TrafficTableRecord> GetTrafficTable(Transaction&, const std::string& service_name) override;
  std::vector<model::TrafficTableRecord>   ListTrafficTables(Transaction&) override;

  Result                            UpsertLease(Transaction&, const model::LeaseRecord&) override;
  std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string& service_name) override;
  Result                            DeleteLease(Transaction&, const std::string& service_name, const std::string& lease_id) override;
  std::vector<model::LeaseRecord>   ListLeases(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace rollout::db::sqlite
