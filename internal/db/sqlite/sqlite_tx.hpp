#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace portwatch::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read transactions use BEGIN DEFERRED.

  Holds the connection's transaction lock until it commits, rolls back
  or is destroyed.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
