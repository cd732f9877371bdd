#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace sportsledger::db::sqlite {

/*
  Owns the single connection to a ledger file.

  SQLite admits one writer, so every transaction on the connection is
  serialized through TxMutex(). The connection runs with foreign keys on
  and synchronous=FULL: an insert that returned is on disk.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements without bound parameters; throws on error.
  void Exec(const std::string& sql);

  // PRAGMA user_version, the ledger schema revision stamped in the file.
  int UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace sportsledger::db::sqlite
