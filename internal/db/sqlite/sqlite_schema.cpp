#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace sportsledger::db::sqlite {
namespace {

constexpr int kSchemaRevision = 1;

std::string DenyUpdate(const std::string& table) {
  return "CREATE TRIGGER IF NOT EXISTS " + table + "_no_update BEFORE UPDATE ON " + table +
         " BEGIN SELECT RAISE(ABORT, 'immutable: " + table + " rows cannot be updated'); END;";
}

std::string DenyDelete(const std::string& table) {
  return "CREATE TRIGGER IF NOT EXISTS " + table + "_no_delete BEFORE DELETE ON " + table +
         " BEGIN SELECT RAISE(ABORT, 'immutable: " + table + " rows cannot be deleted'); END;";
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  const int found = db.UserVersion();
  if (found > kSchemaRevision) {
    throw std::runtime_error("ledger schema revision " + std::to_string(found) + " is newer than supported revision " +
                             std::to_string(kSchemaRevision));
  }

  static const std::vector<std::string> kTables = {
      "CREATE TABLE IF NOT EXISTS info_snapshots (snapshot_id TEXT PRIMARY KEY, game_id TEXT NOT NULL, collected_at TEXT NOT NULL, "
      "schema_version TEXT NOT NULL, source_versions TEXT NOT NULL, raw_payloads TEXT NOT NULL, normalized_fields TEXT NOT NULL, "
      "hash TEXT NOT NULL UNIQUE);",
      "CREATE INDEX IF NOT EXISTS idx_info_snapshots_game ON info_snapshots(game_id, collected_at);",

      "CREATE TABLE IF NOT EXISTS analyses (analysis_id TEXT PRIMARY KEY, created_at TEXT NOT NULL, analysis_version TEXT NOT NULL, "
      "code_version TEXT NOT NULL, model_version TEXT, parent_analysis_id TEXT REFERENCES analyses(analysis_id), "
      "derived_features TEXT NOT NULL, conclusions TEXT NOT NULL, recommended_actions TEXT NOT NULL, hash TEXT NOT NULL UNIQUE);",
      "CREATE INDEX IF NOT EXISTS idx_analyses_parent ON analyses(parent_analysis_id);",

      "CREATE TABLE IF NOT EXISTS analysis_snapshots (analysis_id TEXT NOT NULL REFERENCES analyses(analysis_id), "
      "snapshot_id TEXT NOT NULL REFERENCES info_snapshots(snapshot_id), position INTEGER NOT NULL, "
      "PRIMARY KEY (analysis_id, position));",
      "CREATE INDEX IF NOT EXISTS idx_analysis_snapshots_snapshot ON analysis_snapshots(snapshot_id);",

      "CREATE TABLE IF NOT EXISTS outcomes (outcome_id TEXT PRIMARY KEY, game_id TEXT NOT NULL, occurred_at TEXT NOT NULL, "
      "home_score INTEGER NOT NULL, away_score INTEGER NOT NULL, winner TEXT, stats_summary TEXT NOT NULL, source TEXT NOT NULL, "
      "revision INTEGER NOT NULL CHECK (revision >= 1), supersedes_outcome_id TEXT REFERENCES outcomes(outcome_id), "
      "hash TEXT NOT NULL UNIQUE, UNIQUE (game_id, revision));",

      "CREATE TABLE IF NOT EXISTS evaluations (evaluation_id TEXT PRIMARY KEY, analysis_id TEXT NOT NULL REFERENCES analyses(analysis_id), "
      "outcome_id TEXT NOT NULL REFERENCES outcomes(outcome_id), game_id TEXT NOT NULL, scored_at TEXT NOT NULL, brier_score REAL, "
      "log_loss REAL, roi REAL, edge_realized TEXT NOT NULL, notes TEXT NOT NULL, hash TEXT NOT NULL UNIQUE);",
      "CREATE INDEX IF NOT EXISTS idx_evaluations_analysis ON evaluations(analysis_id);",

      "CREATE TABLE IF NOT EXISTS improvement_proposals (proposal_id TEXT PRIMARY KEY, created_at TEXT NOT NULL, "
      "proposal_text TEXT NOT NULL, suggested_schema_additions TEXT NOT NULL, suggested_modules TEXT NOT NULL, "
      "expected_impact TEXT NOT NULL, status TEXT NOT NULL CHECK (status IN ('pending','accepted','rejected','implemented')), "
      "hash TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_improvement_proposals_hash ON improvement_proposals(hash);",

      "CREATE TABLE IF NOT EXISTS proposal_evaluations (proposal_id TEXT NOT NULL REFERENCES improvement_proposals(proposal_id), "
      "evaluation_id TEXT NOT NULL REFERENCES evaluations(evaluation_id), position INTEGER NOT NULL, "
      "PRIMARY KEY (proposal_id, position));"};

  for (const auto& sql : kTables) {
    db.Exec(sql);
  }

  for (const std::string table : {"info_snapshots", "analyses", "analysis_snapshots", "outcomes", "evaluations", "proposal_evaluations"}) {
    db.Exec(DenyUpdate(table));
    db.Exec(DenyDelete(table));
  }

  db.Exec(DenyDelete("improvement_proposals"));
  db.Exec(
      "CREATE TRIGGER IF NOT EXISTS improvement_proposals_content_immutable BEFORE UPDATE OF proposal_id, created_at, proposal_text, "
      "suggested_schema_additions, suggested_modules, expected_impact ON improvement_proposals "
      "BEGIN SELECT RAISE(ABORT, 'immutable: improvement_proposals content cannot be updated'); END;");
  db.Exec(
      "CREATE TRIGGER IF NOT EXISTS improvement_proposals_status_forward BEFORE UPDATE OF status ON improvement_proposals "
      "WHEN NOT ((OLD.status = 'pending' AND NEW.status IN ('accepted','rejected','implemented')) "
      "OR (OLD.status = 'accepted' AND NEW.status = 'implemented')) "
      "BEGIN SELECT RAISE(ABORT, 'invalid transition: proposal status can only move forward'); END;");
  db.Exec(
      "CREATE TRIGGER IF NOT EXISTS improvement_proposals_hash_follows_status BEFORE UPDATE OF hash ON improvement_proposals "
      "WHEN NEW.status = OLD.status "
      "BEGIN SELECT RAISE(ABORT, 'immutable: improvement_proposals hash only changes with status'); END;");

  db.Exec("SELECT snapshot_id,game_id,collected_at,schema_version,source_versions,raw_payloads,normalized_fields,hash FROM info_snapshots LIMIT 1;");
  db.Exec("SELECT analysis_id,snapshot_id,position FROM analysis_snapshots LIMIT 1;");
  db.Exec("SELECT outcome_id,game_id,revision,supersedes_outcome_id FROM outcomes LIMIT 1;");
  db.Exec("SELECT proposal_id,evaluation_id,position FROM proposal_evaluations LIMIT 1;");

  if (found != kSchemaRevision) {
    db.SetUserVersion(kSchemaRevision);
  }
}

} // namespace sportsledger::db::sqlite
