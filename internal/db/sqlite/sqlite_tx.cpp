#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace portwatch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only)
    : db_(std::move(db)), lock_(db_->TransactionLock()) {
  db_->Exec(read_only ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      observability::Log(spdlog::level::warn, "sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace portwatch::db::sqlite
