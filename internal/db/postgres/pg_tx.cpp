#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace portwatch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  if (read_only) {
    tx_->exec("SET TRANSACTION READ ONLY");
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      observability::Log(spdlog::level::warn, "postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
  Release();
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
  Release();
}

// the work object must go before its connection returns to the pool
void PgTransaction::Release() {
  tx_.reset();
  conn_.reset();
}

} // namespace portwatch::db::postgres
