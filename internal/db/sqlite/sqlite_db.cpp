#include "sqlite_db.hpp"

#include <stdexcept>

namespace sportsledger::db::sqlite {

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "cannot open ledger " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db_)));
  }
  const int rc      = sqlite3_step(stmt);
  const int version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("cannot read user_version of " + path_);
  }
  return version;
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");

  // another process may hold the write lock briefly
  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + std::string(sqlite3_errmsg(db_)));
  }
}

} // namespace sportsledger::db::sqlite
