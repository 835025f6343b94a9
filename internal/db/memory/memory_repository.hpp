#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace rollout::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RolloutRecord> rollouts;
    std::unordered_map<std::string, std::string>          idempotency_index;

    // rollout id -> seq -> entry
    std::unordered_map<std::string, std::map<uint64_t, model::HistoryRecord>> history;

    std::unordered_map<std::string, model::InstanceGroupRecord> groups;
    std::unordered_map<std::string, model::TrafficTableRecord>  traffic;
    std::unordered_map<std::string, model::LeaseRecord>         leases;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace rollout::db::memory
