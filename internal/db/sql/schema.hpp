#pragma once

#include <array>

namespace rollout::db::sql {

/*
  Schema bootstrap statements, applied idempotently at startup by the
  factory. Bodies are protobuf JSON.

  rollout_history is insert-only; nothing in the codebase updates or
  deletes its rows.
*/

inline constexpr std::array<const char*, 7> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS rollouts (id TEXT PRIMARY KEY, service_name TEXT NOT NULL, idempotency_key TEXT UNIQUE,"
    " state INTEGER NOT NULL, terminal INTEGER NOT NULL, version INTEGER NOT NULL, created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL, body TEXT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS rollouts_service_active ON rollouts(service_name, terminal);",
    "CREATE TABLE IF NOT EXISTS rollout_history (rollout_id TEXT NOT NULL REFERENCES rollouts(id), seq INTEGER NOT NULL,"
    " from_state INTEGER NOT NULL, to_state INTEGER NOT NULL, reason INTEGER NOT NULL, diagnostic TEXT NOT NULL,"
    " at_ms INTEGER NOT NULL, PRIMARY KEY (rollout_id, seq));",
    "CREATE TABLE IF NOT EXISTS instance_groups (id TEXT PRIMARY KEY, service_name TEXT NOT NULL, lifecycle_state INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL, body TEXT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS instance_groups_service ON instance_groups(service_name);",
    "CREATE TABLE IF NOT EXISTS traffic_tables (service_name TEXT PRIMARY KEY, version INTEGER NOT NULL, body TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS service_leases (service_name TEXT PRIMARY KEY, lease_id TEXT NOT NULL, holder_id TEXT NOT NULL,"
    " expires_at_ms INTEGER NOT NULL, fencing_token INTEGER NOT NULL);",
};

inline constexpr std::array<const char*, 7> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS rollouts (id TEXT PRIMARY KEY, service_name TEXT NOT NULL, idempotency_key TEXT UNIQUE,"
    " state SMALLINT NOT NULL, terminal BOOLEAN NOT NULL, version BIGINT NOT NULL, created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL, body JSONB NOT NULL);",
    "CREATE INDEX IF NOT EXISTS rollouts_service_active ON rollouts(service_name, terminal);",
    "CREATE TABLE IF NOT EXISTS rollout_history (rollout_id TEXT NOT NULL REFERENCES rollouts(id), seq BIGINT NOT NULL,"
    " from_state SMALLINT NOT NULL, to_state SMALLINT NOT NULL, reason SMALLINT NOT NULL, diagnostic TEXT NOT NULL,"
    " at_ms BIGINT NOT NULL, PRIMARY KEY (rollout_id, seq));",
    "CREATE TABLE IF NOT EXISTS instance_groups (id TEXT PRIMARY KEY, service_name TEXT NOT NULL, lifecycle_state SMALLINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL, body JSONB NOT NULL);",
    "CREATE INDEX IF NOT EXISTS instance_groups_service ON instance_groups(service_name);",
    "CREATE TABLE IF NOT EXISTS traffic_tables (service_name TEXT PRIMARY KEY, version BIGINT NOT NULL, body JSONB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS service_leases (service_name TEXT PRIMARY KEY, lease_id TEXT NOT NULL, holder_id TEXT NOT NULL,"
    " expires_at_ms BIGINT NOT NULL, fencing_token BIGINT NOT NULL);",
};

} // namespace rollout::db::sql
