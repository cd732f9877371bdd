#pragma once

#include "sqlite_db.hpp"

namespace sportsledger::db::sqlite {

/*
  Creates the ledger tables, indexes and immutability triggers if they do
  not exist yet. Idempotent; safe to run on every open.

  Every table carries BEFORE UPDATE / BEFORE DELETE triggers that abort
  with an "immutable:" message. improvement_proposals only admits updates
  of status and hash, and only along forward transitions.

  The schema revision is stamped in PRAGMA user_version; a file stamped
  by a newer revision is refused with std::runtime_error.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace sportsledger::db::sqlite
