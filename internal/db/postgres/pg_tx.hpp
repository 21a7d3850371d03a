#pragma once

#include <memory>
#include <stdexcept>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace portwatch::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction();

  pqxx::work& Work() {
    if (!tx_) throw std::logic_error("postgres transaction already finished");
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void Release();

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

}
