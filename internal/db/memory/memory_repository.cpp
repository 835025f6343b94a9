#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace rollout::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Rollouts
// ------------------------------------------------------------------

Result MemoryRepository::InsertRollout(Transaction& t, const model::RolloutRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.rollouts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "rollout " + r.id);
  if (!r.idempotency_key.empty() && s.idempotency_index.contains(r.idempotency_key)) {
    return Result::Err(ErrorCode::AlreadyExists, "idempotency key " + r.idempotency_key);
  }

  s.rollouts[r.id] = r;
  if (!r.idempotency_key.empty()) {
    s.idempotency_index[r.idempotency_key] = r.id;
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateRollout(Transaction& t, const model::RolloutRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.rollouts.find(r.id);
  if (it == s.rollouts.end()) return Result::Err(ErrorCode::NotFound, "rollout " + r.id);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "rollout " + r.id + " version " + std::to_string(it->second.version) + " != expected " +
                                                std::to_string(expected_version));
  }
  it->second = r;
  return Result::Ok();
}

std::optional<model::RolloutRecord> MemoryRepository::GetRollout(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.rollouts.find(id);
  if (it == s.rollouts.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RolloutRecord> MemoryRepository::FindRolloutByIdempotencyKey(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.idempotency_index.find(key);
  if (it == s.idempotency_index.end()) return std::nullopt;
  return GetRollout(t, it->second);
}

std::optional<model::RolloutRecord> MemoryRepository::FindActiveRollout(Transaction& t, const std::string& service_name) {
  for (const auto& [_, record] : TX(t).View().rollouts) {
    if (record.service_name == service_name && !record.terminal) {
      return record;
    }
  }
  return std::nullopt;
}

std::vector<model::RolloutRecord> MemoryRepository::ListRollouts(Transaction& t, const std::string& service_name, bool include_terminal) {
  std::vector<model::RolloutRecord> out;
  for (const auto& [_, record] : TX(t).View().rollouts) {
    if (!service_name.empty() && record.service_name != service_name) continue;
    if (!include_terminal && record.terminal) continue;
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  auto& entries = TX(t).Mutable().history[r.rollout_id];
  if (entries.contains(r.seq)) {
    return Result::Err(ErrorCode::AlreadyExists, "history " + r.rollout_id + "#" + std::to_string(r.seq));
  }
  entries.emplace(r.seq, r);
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::GetHistory(Transaction& t, const std::string& rollout_id) {
  std::vector<model::HistoryRecord> out;
  const auto&                       s  = TX(t).View();
  auto                              it = s.history.find(rollout_id);
  if (it == s.history.end()) return out;
  for (const auto& [_, entry] : it->second) {
    out.push_back(entry);
  }
  return out;
}

// ------------------------------------------------------------------
// Instance groups
// ------------------------------------------------------------------

Result MemoryRepository::UpsertInstanceGroup(Transaction& t, const model::InstanceGroupRecord& r) {
  TX(t).Mutable().groups[r.id] = r;
  return Result::Ok();
}

std::optional<model::InstanceGroupRecord> MemoryRepository::GetInstanceGroup(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.groups.find(id);
  if (it == s.groups.end()) return std::nullopt;
  return it->second;
}

std::vector<model::InstanceGroupRecord> MemoryRepository::ListInstanceGroups(Transaction& t, const std::string& service_name) {
  std::vector<model::InstanceGroupRecord> out;
  for (const auto& [_, record] : TX(t).View().groups) {
    if (service_name.empty() || record.service_name == service_name) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

// ------------------------------------------------------------------
// Traffic tables
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTrafficTable(Transaction& t, const model::TrafficTableRecord& r) {
  TX(t).Mutable().traffic[r.service_name] = r;
  return Result::Ok();
}

std::optional<model::TrafficTableRecord> MemoryRepository::GetTrafficTable(Transaction& t, const std::string& service_name) {
  const auto& s  = TX(t).View();
  auto        it = s.traffic.find(service_name);
  if (it == s.traffic.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TrafficTableRecord> MemoryRepository::ListTrafficTables(Transaction& t) {
  std::vector<model::TrafficTableRecord> out;
  for (const auto& [_, record] : TX(t).View().traffic) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result MemoryRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
  TX(t).Mutable().leases[r.service_name] = r;
  return Result::Ok();
}

std::optional<model::LeaseRecord> MemoryRepository::GetLease(Transaction& t, const std::string& service_name) {
  const auto& s  = TX(t).View();
  auto        it = s.leases.find(service_name);
  if (it == s.leases.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteLease(Transaction& t, const std::string& service_name, const std::string& lease_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.leases.find(service_name);
  if (it == s.leases.end() || it->second.lease_id != lease_id) {
    return Result::Err(ErrorCode::NotFound, "lease " + lease_id);
  }
  s.leases.erase(it);
  return Result::Ok();
}

std::vector<model::LeaseRecord> MemoryRepository::ListLeases(Transaction& t) {
  std::vector<model::LeaseRecord> out;
  for (const auto& [_, record] : TX(t).View().leases) {
    out.push_back(record);
  }
  return out;
}

} // namespace rollout::db::memory
