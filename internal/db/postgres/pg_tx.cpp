#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace rollout::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::transaction<pqxx::isolation_level::serializable>>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      ROLLOUT_LOG_ERROR("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  tx_->abort();
}

} // namespace rollout::db::postgres
