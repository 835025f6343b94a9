#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>

#include "internal/db/model/body_codec.hpp"

namespace rollout::db::sqlite {

using rollout::db::ErrorCode;
using rollout::db::Result;

namespace v1 = rollout::manager::core::v1;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kRolloutColumns = "id,service_name,idempotency_key,state,terminal,version,created_at_ms,updated_at_ms,body";

model::RolloutRecord ReadRollout(sqlite3_stmt* st) {
  model::RolloutRecord r;
  r.id              = ColText(st, 0);
  r.service_name    = ColText(st, 1);
  r.idempotency_key = ColText(st, 2);
  r.state           = static_cast<v1::RolloutState>(ColI32(st, 3));
  r.terminal        = ColI32(st, 4) != 0;
  r.version         = ColU64(st, 5);
  r.created_at_ms   = ColU64(st, 6);
  r.updated_at_ms   = ColU64(st, 7);
  model::DecodeBody(ColText(st, 8), &r.body);
  return r;
}

model::InstanceGroupRecord ReadGroup(sqlite3_stmt* st) {
  model::InstanceGroupRecord r;
  r.id              = ColText(st, 0);
  r.service_name    = ColText(st, 1);
  r.lifecycle_state = static_cast<v1::LifecycleState>(ColI32(st, 2));
  r.updated_at_ms   = ColU64(st, 3);
  model::DecodeBody(ColText(st, 4), &r.body);
  return r;
}

model::TrafficTableRecord ReadTraffic(sqlite3_stmt* st) {
  model::TrafficTableRecord r;
  r.service_name = ColText(st, 0);
  r.version      = ColU64(st, 1);
  model::DecodeBody(ColText(st, 2), &r.body);
  return r;
}

model::LeaseRecord ReadLease(sqlite3_stmt* st) {
  model::LeaseRecord r;
  r.service_name  = ColText(st, 0);
  r.lease_id      = ColText(st, 1);
  r.holder_id     = ColText(st, 2);
  r.expires_at_ms = ColU64(st, 3);
  r.fencing_token = ColU64(st, 4);
  return r;
}

template <typename Record, typename Reader>
std::optional<Record> QueryOne(Statement st, Reader read) {
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return read(st.get());
}

template <typename Record, typename Reader>
std::vector<Record> QueryAll(Statement st, Reader read) {
  std::vector<Record> out;
  if (!st) {
    return out;
  }
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(read(st.get()));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Rollouts
// ------------------------------------------------------------------

Result SqliteRepository::InsertRollout(Transaction& t, const model::RolloutRecord& r) {
  auto* db = TX(t).Handle();

  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode rollout body");

  auto st = Prepare(db,
                    "INSERT INTO rollouts(id,service_name,idempotency_key,state,terminal,version,created_at_ms,updated_at_ms,body)"
                    " VALUES(?,?,NULLIF(?,''),?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.service_name);
  BindText(st.get(), 3, r.idempotency_key);
  BindI32(st.get(), 4, static_cast<int>(r.state));
  BindI32(st.get(), 5, r.terminal ? 1 : 0);
  BindU64(st.get(), 6, r.version);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);
  BindText(st.get(), 9, body);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateRollout(Transaction& t, const model::RolloutRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode rollout body");

  auto st = Prepare(db, "UPDATE rollouts SET state=?,terminal=?,version=?,updated_at_ms=?,body=? WHERE id=? AND version=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.state));
  BindI32(st.get(), 2, r.terminal ? 1 : 0);
  BindU64(st.get(), 3, r.version);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, body);
  BindText(st.get(), 6, r.id);
  BindU64(st.get(), 7, expected_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    if (GetRollout(t, r.id)) {
      return Result::Err(ErrorCode::Conflict, "rollout " + r.id + " was modified concurrently");
    }
    return Result::Err(ErrorCode::NotFound, "rollout " + r.id);
  }
  return Result::Ok();
}

std::optional<model::RolloutRecord> SqliteRepository::GetRollout(Transaction& t, const std::string& id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE id=?;";
  auto  st  = Prepare(db, sql.c_str());
  if (st) BindText(st.get(), 1, id);
  return QueryOne<model::RolloutRecord>(std::move(st), ReadRollout);
}

std::optional<model::RolloutRecord> SqliteRepository::FindRolloutByIdempotencyKey(Transaction& t, const std::string& key) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE idempotency_key=?;";
  auto  st  = Prepare(db, sql.c_str());
  if (st) BindText(st.get(), 1, key);
  return QueryOne<model::RolloutRecord>(std::move(st), ReadRollout);
}

std::optional<model::RolloutRecord> SqliteRepository::FindActiveRollout(Transaction& t, const std::string& service_name) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE service_name=? AND terminal=0 LIMIT 1;";
  auto  st  = Prepare(db, sql.c_str());
  if (st) BindText(st.get(), 1, service_name);
  return QueryOne<model::RolloutRecord>(std::move(st), ReadRollout);
}

std::vector<model::RolloutRecord> SqliteRepository::ListRollouts(Transaction& t, const std::string& service_name, bool include_terminal) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kRolloutColumns +
             " FROM rollouts WHERE (?1='' OR service_name=?1) AND (?2=1 OR terminal=0) ORDER BY created_at_ms, id;";
  auto st = Prepare(db, sql.c_str());
  if (st) {
    BindText(st.get(), 1, service_name);
    BindI32(st.get(), 2, include_terminal ? 1 : 0);
  }
  return QueryAll<model::RolloutRecord>(std::move(st), ReadRollout);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO rollout_history(rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms)"
                    " VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.rollout_id);
  BindU64(st.get(), 2, r.seq);
  BindI32(st.get(), 3, static_cast<int>(r.from_state));
  BindI32(st.get(), 4, static_cast<int>(r.to_state));
  BindI32(st.get(), 5, static_cast<int>(r.reason));
  BindText(st.get(), 6, r.diagnostic);
  BindU64(st.get(), 7, r.at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::HistoryRecord> SqliteRepository::GetHistory(Transaction& t, const std::string& rollout_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms"
                     " FROM rollout_history WHERE rollout_id=? ORDER BY seq;");
  if (st) BindText(st.get(), 1, rollout_id);

  return QueryAll<model::HistoryRecord>(std::move(st), [](sqlite3_stmt* row) {
    model::HistoryRecord r;
    r.rollout_id = ColText(row, 0);
    r.seq        = ColU64(row, 1);
    r.from_state = static_cast<v1::RolloutState>(ColI32(row, 2));
    r.to_state   = static_cast<v1::RolloutState>(ColI32(row, 3));
    r.reason     = static_cast<v1::ReasonCode>(ColI32(row, 4));
    r.diagnostic = ColText(row, 5);
    r.at_ms      = ColU64(row, 6);
    return r;
  });
}

// ------------------------------------------------------------------
// Instance groups
// ------------------------------------------------------------------

Result SqliteRepository::UpsertInstanceGroup(Transaction& t, const model::InstanceGroupRecord& r) {
  auto* db = TX(t).Handle();

  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode instance group body");

  auto st = Prepare(db,
                    "INSERT INTO instance_groups(id,service_name,lifecycle_state,updated_at_ms,body) VALUES(?,?,?,?,?)"
                    " ON CONFLICT(id) DO UPDATE SET lifecycle_state=excluded.lifecycle_state,"
                    " updated_at_ms=excluded.updated_at_ms, body=excluded.body;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.service_name);
  BindI32(st.get(), 3, static_cast<int>(r.lifecycle_state));
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, body);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::InstanceGroupRecord> SqliteRepository::GetInstanceGroup(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,service_name,lifecycle_state,updated_at_ms,body FROM instance_groups WHERE id=?;");
  if (st) BindText(st.get(), 1, id);
  return QueryOne<model::InstanceGroupRecord>(std::move(st), ReadGroup);
}

std::vector<model::InstanceGroupRecord> SqliteRepository::ListInstanceGroups(Transaction& t, const std::string& service_name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,service_name,lifecycle_state,updated_at_ms,body FROM instance_groups"
                     " WHERE (?1='' OR service_name=?1) ORDER BY id;");
  if (st) BindText(st.get(), 1, service_name);
  return QueryAll<model::InstanceGroupRecord>(std::move(st), ReadGroup);
}

// ------------------------------------------------------------------
// Traffic tables
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTrafficTable(Transaction& t, const model::TrafficTableRecord& r) {
  auto* db = TX(t).Handle();

  std::string body;
  if (!model::EncodeBody(r.body, &body)) return Result::Err(ErrorCode::InternalError, "encode traffic body");

  auto st = Prepare(db,
                    "INSERT INTO traffic_tables(service_name,version,body) VALUES(?,?,?)"
                    " ON CONFLICT(service_name) DO UPDATE SET version=excluded.version, body=excluded.body;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.service_name);
  BindU64(st.get(), 2, r.version);
  BindText(st.get(), 3, body);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TrafficTableRecord> SqliteRepository::GetTrafficTable(Transaction& t, const std::string& service_name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT service_name,version,body FROM traffic_tables WHERE service_name=?;");
  if (st) BindText(st.get(), 1, service_name);
  return QueryOne<model::TrafficTableRecord>(std::move(st), ReadTraffic);
}

std::vector<model::TrafficTableRecord> SqliteRepository::ListTrafficTables(Transaction& t) {
  auto* db = TX(t).Handle();
  return QueryAll<model::TrafficTableRecord>(Prepare(db, "SELECT service_name,version,body FROM traffic_tables ORDER BY service_name;"),
                                             ReadTraffic);
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO service_leases(service_name,lease_id,holder_id,expires_at_ms,fencing_token) VALUES(?,?,?,?,?)"
                    " ON CONFLICT(service_name) DO UPDATE SET lease_id=excluded.lease_id, holder_id=excluded.holder_id,"
                    " expires_at_ms=excluded.expires_at_ms, fencing_token=excluded.fencing_token;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.service_name);
  BindText(st.get(), 2, r.lease_id);
  BindText(st.get(), 3, r.holder_id);
  BindU64(st.get(), 4, r.expires_at_ms);
  BindU64(st.get(), 5, r.fencing_token);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LeaseRecord> SqliteRepository::GetLease(Transaction& t, const std::string& service_name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases WHERE service_name=?;");
  if (st) BindText(st.get(), 1, service_name);
  return QueryOne<model::LeaseRecord>(std::move(st), ReadLease);
}

Result SqliteRepository::DeleteLease(Transaction& t, const std::string& service_name, const std::string& lease_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM service_leases WHERE service_name=? AND lease_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, service_name);
  BindText(st.get(), 2, lease_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "lease " + lease_id);
  return Result::Ok();
}

std::vector<model::LeaseRecord> SqliteRepository::ListLeases(Transaction& t) {
  auto* db = TX(t).Handle();
  return QueryAll<model::LeaseRecord>(
      Prepare(db, "SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases ORDER BY service_name;"), ReadLease);
}

} // namespace rollout::db::sqlite
