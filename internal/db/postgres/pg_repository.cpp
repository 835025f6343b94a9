#include "pg_repository.hpp"

#include "internal/db/model/body_codec.hpp"

namespace rollout::db::postgres {

namespace v1 = rollout::manager::core::v1;

namespace {

model::RolloutRecord ReadRollout(const pqxx::row& row) {
  model::RolloutRecord r;
  r.id              = row[0].c_str();
  r.service_name    = row[1].c_str();
  r.idempotency_key = row[2].c_str();
  r.state           = static_cast<v1::RolloutState>(row[3].as<int>());
  r.terminal        = row[4].as<bool>();
  r.version         = row[5].as<uint64_t>();
  r.created_at_ms   = row[6].as<uint64_t>();
  r.updated_at_ms   = row[7].as<uint64_t>();
  model::DecodeBody(row[8].c_str(), &r.body);
  return r;
}

model::InstanceGroupRecord ReadGroup(const pqxx::row& row) {
  model::InstanceGroupRecord r;
  r.id              = row[0].c_str();
  r.service_name    = row[1].c_str();
  r.lifecycle_state = static_cast<v1::LifecycleState>(row[2].as<int>());
  r.updated_at_ms   = row[3].as<uint64_t>();
  model::DecodeBody(row[4].c_str(), &r.body);
  return r;
}

model::TrafficTableRecord ReadTraffic(const pqxx::row& row) {
  model::TrafficTableRecord r;
  r.service_name = row[0].c_str();
  r.version      = row[1].as<uint64_t>();
  model::DecodeBody(row[2].c_str(), &r.body);
  return r;
}

model::LeaseRecord ReadLease(const pqxx::row& row) {
  model::LeaseRecord r;
  r.service_name  = row[0].c_str();
  r.lease_id      = row[1].c_str();
  r.holder_id     = row[2].c_str();
  r.expires_at_ms = row[3].as<uint64_t>();
  r.fencing_token = row[4].as<uint64_t>();
  return r;
}

template <typename Record, typename Reader>
std::optional<Record> FirstRow(const pqxx::result& res, Reader read) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

template <typename Record, typename Reader>
std::vector<Record> AllRows(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Rollouts
// ------------------------------------------------------------------

Result PgRepository::InsertRollout(Transaction& t, const model::RolloutRecord& r) {
  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode rollout body");
  try {
    TX(t).Work().exec_prepared("insert_rollout", r.id, r.service_name, r.idempotency_key, static_cast<int>(r.state), r.terminal, r.version,
                               r.created_at_ms, r.updated_at_ms, body);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRollout(Transaction& t, const model::RolloutRecord& r, uint64_t expected_version) {
  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode rollout body");
  try {
    auto res = TX(t).Work().exec_prepared("update_rollout", r.id, static_cast<int>(r.state), r.terminal, r.version, r.updated_at_ms, body,
                                          expected_version);
    if (res.affected_rows() == 0) {
      if (GetRollout(t, r.id)) {
        return Result::Err(ErrorCode::Conflict, "rollout " + r.id + " was modified concurrently");
      }
      return Result::Err(ErrorCode::NotFound, "rollout " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RolloutRecord> PgRepository::GetRollout(Transaction& t, const std::string& id) {
  return FirstRow<model::RolloutRecord>(TX(t).Work().exec_prepared("get_rollout", id), ReadRollout);
}

std::optional<model::RolloutRecord> PgRepository::FindRolloutByIdempotencyKey(Transaction& t, const std::string& key) {
  return FirstRow<model::RolloutRecord>(TX(t).Work().exec_prepared("get_rollout_by_key", key), ReadRollout);
}

std::optional<model::RolloutRecord> PgRepository::FindActiveRollout(Transaction& t, const std::string& service_name) {
  return FirstRow<model::RolloutRecord>(TX(t).Work().exec_prepared("get_active_rollout", service_name), ReadRollout);
}

std::vector<model::RolloutRecord> PgRepository::ListRollouts(Transaction& t, const std::string& service_name, bool include_terminal) {
  return AllRows<model::RolloutRecord>(TX(t).Work().exec_prepared("list_rollouts", service_name, include_terminal), ReadRollout);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  try {
    TX(t).Work().exec_prepared("append_history", r.rollout_id, r.seq, static_cast<int>(r.from_state), static_cast<int>(r.to_state),
                               static_cast<int>(r.reason), r.diagnostic, r.at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::GetHistory(Transaction& t, const std::string& rollout_id) {
  return AllRows<model::HistoryRecord>(TX(t).Work().exec_prepared("get_history", rollout_id), [](const pqxx::row& row) {
    model::HistoryRecord r;
    r.rollout_id = row[0].c_str();
    r.seq        = row[1].as<uint64_t>();
    r.from_state = static_cast<v1::RolloutState>(row[2].as<int>());
    r.to_state   = static_cast<v1::RolloutState>(row[3].as<int>());
    r.reason     = static_cast<v1::ReasonCode>(row[4].as<int>());
    r.diagnostic = row[5].c_str();
    r.at_ms      = row[6].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Instance groups
// ------------------------------------------------------------------

Result PgRepository::UpsertInstanceGroup(Transaction& t, const model::InstanceGroupRecord& r) {
  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode instance group body");
  try {
    TX(t).Work().exec_prepared("upsert_group", r.id, r.service_name, static_cast<int>(r.lifecycle_state), r.updated_at_ms, body);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceGroupRecord> PgRepository::GetInstanceGroup(Transaction& t, const std::string& id) {
  return FirstRow<model::InstanceGroupRecord>(TX(t).Work().exec_prepared("get_group", id), ReadGroup);
}

std::vector<model::InstanceGroupRecord> PgRepository::ListInstanceGroups(Transaction& t, const std::string& service_name) {
  return AllRows<model::InstanceGroupRecord>(TX(t).Work().exec_prepared("list_groups", service_name), ReadGroup);
}

// ------------------------------------------------------------------
// Traffic tables
// ------------------------------------------------------------------

Result PgRepository::UpsertTrafficTable(Transaction& t, const model::TrafficTableRecord& r) {
  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode traffic body");
  try {
    TX(t).Work().exec_prepared("upsert_traffic", r.service_name, r.version, body);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TrafficTableRecord> PgRepository::GetTrafficTable(Transaction& t, const std::string& service_name) {
  return FirstRow<model::TrafficTableRecord>(TX(t).Work().exec_prepared("get_traffic", service_name), ReadTraffic);
}

std::vector<model::TrafficTableRecord> PgRepository::ListTrafficTables(Transaction& t) {
  return AllRows<model::TrafficTableRecord>(TX(t).Work().exec_prepared("list_traffic"), ReadTraffic);
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result PgRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_lease", r.service_name, r.lease_id, r.holder_id, r.expires_at_ms, r.fencing_token);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LeaseRecord> PgRepository::GetLease(Transaction& t, const std::string& service_name) {
  return FirstRow<model::LeaseRecord>(TX(t).Work().exec_prepared("get_lease", service_name), ReadLease);
}

Result PgRepository::DeleteLease(Transaction& t, const std::string& service_name, const std::string& lease_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_lease", service_name, lease_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lease " + lease_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LeaseRecord> PgRepository::ListLeases(Transaction& t) {
  return AllRows<model::LeaseRecord>(TX(t).Work().exec_prepared("list_leases"), ReadLease);
}

} // namespace rollout::db::postgres
