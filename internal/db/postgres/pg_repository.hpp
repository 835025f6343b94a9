#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rollout::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace rollout::db::postgres
