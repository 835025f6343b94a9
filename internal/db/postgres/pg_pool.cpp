#include "pg_pool.hpp"

#include <string>

namespace rollout::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kRolloutColumns =
      "id, service_name, COALESCE(idempotency_key, ''), state, terminal, version, created_at_ms, updated_at_ms, body::text";

  conn.prepare("insert_rollout",
               "INSERT INTO rollouts(id,service_name,idempotency_key,state,terminal,version,created_at_ms,updated_at_ms,body) "
               "VALUES($1,$2,NULLIF($3,''),$4,$5,$6,$7,$8,$9::jsonb)");
  conn.prepare("update_rollout",
               "UPDATE rollouts SET state=$2,terminal=$3,version=$4,updated_at_ms=$5,body=$6::jsonb "
               "WHERE id=$1 AND version=$7");
  conn.prepare("get_rollout", std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE id=$1");
  conn.prepare("get_rollout_by_key", std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE idempotency_key=$1");
  conn.prepare("get_active_rollout", std::string("SELECT ") + kRolloutColumns + " FROM rollouts WHERE service_name=$1 AND NOT terminal LIMIT 1");
  conn.prepare("list_rollouts", std::string("SELECT ") + kRolloutColumns +
                                    " FROM rollouts WHERE ($1='' OR service_name=$1) AND ($2 OR NOT terminal) ORDER BY created_at_ms, id");

  conn.prepare("append_history",
               "INSERT INTO rollout_history(rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("get_history",
               "SELECT rollout_id,seq,from_state,to_state,reason,diagnostic,at_ms "
               "FROM rollout_history WHERE rollout_id=$1 ORDER BY seq");

  conn.prepare("upsert_group",
               "INSERT INTO instance_groups(id,service_name,lifecycle_state,updated_at_ms,body) VALUES($1,$2,$3,$4,$5::jsonb) "
               "ON CONFLICT(id) DO UPDATE SET lifecycle_state=excluded.lifecycle_state, "
               "updated_at_ms=excluded.updated_at_ms, body=excluded.body");
  conn.prepare("get_group", "SELECT id,service_name,lifecycle_state,updated_at_ms,body::text FROM instance_groups WHERE id=$1");
  conn.prepare("list_groups",
               "SELECT id,service_name,lifecycle_state,updated_at_ms,body::text FROM instance_groups "
               "WHERE ($1='' OR service_name=$1) ORDER BY id");

  conn.prepare("upsert_traffic",
               "INSERT INTO traffic_tables(service_name,version,body) VALUES($1,$2,$3::jsonb) "
               "ON CONFLICT(service_name) DO UPDATE SET version=excluded.version, body=excluded.body");
  conn.prepare("get_traffic", "SELECT service_name,version,body::text FROM traffic_tables WHERE service_name=$1");
  conn.prepare("list_traffic", "SELECT service_name,version,body::text FROM traffic_tables ORDER BY service_name");

  conn.prepare("upsert_lease",
               "INSERT INTO service_leases(service_name,lease_id,holder_id,expires_at_ms,fencing_token) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(service_name) DO UPDATE SET lease_id=excluded.lease_id, holder_id=excluded.holder_id, "
               "expires_at_ms=excluded.expires_at_ms, fencing_token=excluded.fencing_token");
  conn.prepare("get_lease", "SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases WHERE service_name=$1");
  conn.prepare("delete_lease", "DELETE FROM service_leases WHERE service_name=$1 AND lease_id=$2");
  conn.prepare("list_leases", "SELECT service_name,lease_id,holder_id,expires_at_ms,fencing_token FROM service_leases ORDER BY service_name");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace rollout::db::postgres
