#pragma once

namespace sportsledger::db {

/*
  Unit of work against a ledger repository.

  Every backend provides:

  - nothing written inside the transaction is visible to other readers
    until Commit() returns
  - a committed insert is durable and can never be taken back
  - Rollback(), or destroying an unfinished transaction, drops the
    whole write set (an analysis and its input links go together)
  - one open transaction per repository at a time; a second Begin()
    waits for the first to finish

  Finishing a transaction twice is a programming error (std::logic_error).

  SQLite: BEGIN IMMEDIATE on the shared connection
  Memory: writer lock over a copy of the committed state
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

} // namespace sportsledger::db
