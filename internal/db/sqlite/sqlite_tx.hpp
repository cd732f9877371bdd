#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace sportsledger::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection. The database write
  lock is taken up front so the uniqueness checks and the insert see the
  same state; the connection's transaction mutex is held until Finish.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  void Finish(const char* sql);

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

}
