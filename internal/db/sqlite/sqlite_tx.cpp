#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sportsledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      Finish("ROLLBACK;");
    } catch (const std::exception& e) {
      SPORTSLEDGER_LOG_ERROR("SQLite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

void SqliteTransaction::Finish(const char* sql) {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  finished_ = true;
  try {
    db_->Exec(sql);
  } catch (const std::exception&) {
    // a failed COMMIT leaves the transaction open
    if (!sqlite3_get_autocommit(db_->Handle()) && sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      SPORTSLEDGER_LOG_ERROR("SQLite rollback after failed statement failed",
                             {observability::StringField("statement", sql),
                              observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
    }
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

} // namespace sportsledger::db::sqlite
