#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace rollout::db::postgres {

/*
  One pooled connection per transaction, SERIALIZABLE isolation so the
  version check in UpdateRollout and the lease check cannot interleave with
  another controller's writes.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::transaction_base& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection>                          conn_;
  std::unique_ptr<pqxx::transaction<pqxx::isolation_level::serializable>> tx_;
  bool                                                       committed_ = false;
  bool                                                       finished_  = false;
};

} // namespace rollout::db::postgres
