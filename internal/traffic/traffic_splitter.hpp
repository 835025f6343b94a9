#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "weight_table.hpp"

namespace rollout::traffic {

using WeightTablePtr = std::shared_ptr<const WeightTable>;

/*
  Per-service traffic tables.

  Readers get the current snapshot without taking a lock; a reader never
  observes a partially applied update. Writers for one service are
  serialized, persist the new table, then publish it. Every write bumps
  the table version; callers passing expected_version get util::Conflict
  when someone else wrote first.
*/
class TrafficSplitter {
 public:
  explicit TrafficSplitter(std::shared_ptr<db::Repository> repository);

  // Loads persisted tables. Call before serving reads.
  void Hydrate();

  // Never null; a service with no table yields an empty version-0 table.
  WeightTablePtr GetWeights(const std::string& service_name) const;

  // Replaces the weight map. Groups left out receive no traffic.
  WeightTablePtr SetWeights(const std::string& service_name, const std::map<std::string, uint32_t>& weights,
                            std::optional<uint64_t> expected_version = std::nullopt);

  WeightTablePtr SetMirror(const std::string& service_name, const std::string& group_id);
  WeightTablePtr ClearMirror(const std::string& service_name, const std::string& group_id);

  // Drops a zero-weight group from the table; util::InvalidArgument while it still has weight.
  WeightTablePtr RemoveGroup(const std::string& service_name, const std::string& group_id);

 private:
  struct Slot {
    std::atomic<WeightTablePtr> table;
    std::mutex                  write_mutex;
  };

  Slot& SlotFor(const std::string& service_name);
  Slot* FindSlot(const std::string& service_name) const;

  // Caller holds slot.write_mutex.
  WeightTablePtr Publish(Slot& slot, WeightTable next);

  static void Validate(const std::string& service_name, const std::map<std::string, uint32_t>& weights);

  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex                              slots_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace rollout::traffic
