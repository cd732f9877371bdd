#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/json.hpp"

namespace sportsledger::db::sqlite {

using sportsledger::db::ErrorCode;
using sportsledger::db::Result;

namespace {

constexpr const char* kSnapshotColumns =
    "SELECT snapshot_id,game_id,collected_at,schema_version,source_versions,raw_payloads,normalized_fields,hash FROM info_snapshots";
constexpr const char* kAnalysisColumns =
    "SELECT analysis_id,created_at,analysis_version,code_version,model_version,parent_analysis_id,derived_features,conclusions,"
    "recommended_actions,hash FROM analyses";
constexpr const char* kOutcomeColumns =
    "SELECT outcome_id,game_id,occurred_at,home_score,away_score,winner,stats_summary,source,revision,supersedes_outcome_id,hash "
    "FROM outcomes";
constexpr const char* kEvaluationColumns =
    "SELECT evaluation_id,analysis_id,outcome_id,game_id,scored_at,brier_score,log_loss,roi,edge_realized,notes,hash FROM evaluations";
constexpr const char* kProposalColumns =
    "SELECT proposal_id,created_at,proposal_text,suggested_schema_additions,suggested_modules,expected_impact,status,hash "
    "FROM improvement_proposals";

// Prepared statement owned for the duration of one call.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db_)));
    }
  }

  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Read path: true on a row, false when done, throws on error.
  bool Next() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(db_)));
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindText(st, idx, util::FormatTimestamp(tp));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::ParseTimestamp(ColText(st, col));
}

template <typename Record>
std::optional<Record> First(std::vector<Record> records) {
  if (records.empty()) return std::nullopt;
  return std::move(records.front());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

std::vector<RecordKey> SqliteRepository::ListRecordKeys(Transaction& t, model::EntityType entity) {
  const char* sql = nullptr;
  switch (entity) {
    case model::EntityType::kSnapshot:
      sql = "SELECT snapshot_id,hash FROM info_snapshots ORDER BY collected_at, snapshot_id;";
      break;
    case model::EntityType::kAnalysis:
      sql = "SELECT analysis_id,hash FROM analyses ORDER BY created_at, analysis_id;";
      break;
    case model::EntityType::kOutcome:
      sql = "SELECT outcome_id,hash FROM outcomes ORDER BY game_id, revision;";
      break;
    case model::EntityType::kEvaluation:
      sql = "SELECT evaluation_id,hash FROM evaluations ORDER BY scored_at, evaluation_id;";
      break;
    case model::EntityType::kProposal:
      sql = "SELECT proposal_id,hash FROM improvement_proposals ORDER BY created_at, proposal_id;";
      break;
  }
  if (!sql) return {};

  Statement              st(TX(t).Handle(), sql);
  std::vector<RecordKey> out;
  while (st.Next()) {
    out.push_back(RecordKey{ColText(st.get(), 0), ColText(st.get(), 1)});
  }
  return out;
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string message = sqlite3_errmsg(db);
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT: {
      if (message.rfind("immutable:", 0) == 0) return Result::Err(ErrorCode::ImmutableViolation, message);
      if (message.rfind("invalid transition:", 0) == 0) return Result::Err(ErrorCode::Conflict, message);
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, message);
      }
      return Result::Err(ErrorCode::ConstraintViolation, message);
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::Snapshot& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO info_snapshots(snapshot_id,game_id,collected_at,schema_version,source_versions,raw_payloads,"
               "normalized_fields,hash) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.snapshot_id);
  BindText(st.get(), 2, r.game_id);
  BindTime(st.get(), 3, r.collected_at);
  BindText(st.get(), 4, r.schema_version);
  BindText(st.get(), 5, util::ToJson(util::ToStruct(r.source_versions)));
  BindText(st.get(), 6, util::ToJson(r.raw_payloads));
  BindText(st.get(), 7, util::ToJson(r.normalized_fields));
  BindText(st.get(), 8, r.hash);

  return Translate(db, st.Step());
}

std::vector<model::Snapshot> SqliteRepository::QuerySnapshots(Transaction& t, const std::string& where,
                                                              const std::vector<std::string>& params) {
  Statement st(TX(t).Handle(), std::string(kSnapshotColumns) + " " + where + ";");
  for (size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Snapshot> out;
  while (st.Next()) {
    model::Snapshot r;
    r.snapshot_id       = ColText(st.get(), 0);
    r.game_id           = ColText(st.get(), 1);
    r.collected_at      = ColTime(st.get(), 2);
    r.schema_version    = ColText(st.get(), 3);
    r.source_versions   = util::ToStringMap(util::ParseStruct(ColText(st.get(), 4)));
    r.raw_payloads      = util::ParseStruct(ColText(st.get(), 5));
    r.normalized_fields = util::ParseStruct(ColText(st.get(), 6));
    r.hash              = ColText(st.get(), 7);
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<model::Snapshot> SqliteRepository::GetSnapshot(Transaction& t, const std::string& id) {
  return First(QuerySnapshots(t, "WHERE snapshot_id=?", {id}));
}

std::optional<model::Snapshot> SqliteRepository::FindSnapshotByHash(Transaction& t, const std::string& hash) {
  return First(QuerySnapshots(t, "WHERE hash=?", {hash}));
}

std::vector<model::Snapshot> SqliteRepository::ListSnapshots(Transaction& t) {
  return QuerySnapshots(t, "ORDER BY collected_at, snapshot_id", {});
}

std::vector<model::Snapshot> SqliteRepository::ListSnapshotsByGame(Transaction& t, const std::string& game_id,
                                                                   std::optional<util::TimePoint> as_of) {
  if (as_of) {
    return QuerySnapshots(t, "WHERE game_id=? AND collected_at<=? ORDER BY collected_at, snapshot_id",
                          {game_id, util::FormatTimestamp(*as_of)});
  }
  return QuerySnapshots(t, "WHERE game_id=? ORDER BY collected_at, snapshot_id", {game_id});
}

std::vector<std::string> SqliteRepository::ListGameIds(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT DISTINCT game_id FROM info_snapshots ORDER BY game_id;");
  std::vector<std::string> out;
  while (st.Next()) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

// ------------------------------------------------------------------
// Analyses
// ------------------------------------------------------------------

Result SqliteRepository::InsertAnalysis(Transaction& t, const model::Analysis& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO analyses(analysis_id,created_at,analysis_version,code_version,model_version,parent_analysis_id,"
               "derived_features,conclusions,recommended_actions,hash) VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.analysis_id);
  BindTime(st.get(), 2, r.created_at);
  BindText(st.get(), 3, r.analysis_version);
  BindText(st.get(), 4, r.code_version);
  BindOptText(st.get(), 5, r.model_version);
  BindOptText(st.get(), 6, r.parent_analysis_id);
  BindText(st.get(), 7, util::ToJson(r.derived_features));
  BindText(st.get(), 8, util::ToJson(r.conclusions));
  BindText(st.get(), 9, util::ToJson(r.recommended_actions));
  BindText(st.get(), 10, r.hash);

  auto result = Translate(db, st.Step());
  if (!result) return result;

  Statement join(db, "INSERT INTO analysis_snapshots(analysis_id,snapshot_id,position) VALUES(?,?,?);");
  for (size_t i = 0; i < r.input_snapshot_ids.size(); ++i) {
    sqlite3_reset(join.get());
    BindText(join.get(), 1, r.analysis_id);
    BindText(join.get(), 2, r.input_snapshot_ids[i]);
    BindI64(join.get(), 3, static_cast<int64_t>(i));
    result = Translate(db, join.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::Analysis> SqliteRepository::QueryAnalyses(Transaction& t, const std::string& where,
                                                             const std::vector<std::string>& params) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string(kAnalysisColumns) + " " + where + ";");
  for (size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Analysis> out;
  while (st.Next()) {
    model::Analysis r;
    r.analysis_id         = ColText(st.get(), 0);
    r.created_at          = ColTime(st.get(), 1);
    r.analysis_version    = ColText(st.get(), 2);
    r.code_version        = ColText(st.get(), 3);
    r.model_version       = ColOptText(st.get(), 4);
    r.parent_analysis_id  = ColOptText(st.get(), 5);
    r.derived_features    = util::ParseStruct(ColText(st.get(), 6));
    r.conclusions         = util::ParseStruct(ColText(st.get(), 7));
    r.recommended_actions = util::ParseList(ColText(st.get(), 8));
    r.hash                = ColText(st.get(), 9);
    out.push_back(std::move(r));
  }

  Statement inputs(db, "SELECT snapshot_id FROM analysis_snapshots WHERE analysis_id=? ORDER BY position;");
  for (auto& analysis : out) {
    sqlite3_reset(inputs.get());
    BindText(inputs.get(), 1, analysis.analysis_id);
    while (inputs.Next()) {
      analysis.input_snapshot_ids.push_back(ColText(inputs.get(), 0));
    }
  }
  return out;
}

std::optional<model::Analysis> SqliteRepository::GetAnalysis(Transaction& t, const std::string& id) {
  return First(QueryAnalyses(t, "WHERE analysis_id=?", {id}));
}

std::optional<model::Analysis> SqliteRepository::FindAnalysisByHash(Transaction& t, const std::string& hash) {
  return First(QueryAnalyses(t, "WHERE hash=?", {hash}));
}

std::vector<model::Analysis> SqliteRepository::ListAnalyses(Transaction& t) {
  return QueryAnalyses(t, "ORDER BY created_at, analysis_id", {});
}

std::vector<model::Analysis> SqliteRepository::ListChildAnalyses(Transaction& t, const std::string& parent_id) {
  return QueryAnalyses(t, "WHERE parent_analysis_id=? ORDER BY created_at, analysis_id", {parent_id});
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Result SqliteRepository::InsertOutcome(Transaction& t, const model::Outcome& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO outcomes(outcome_id,game_id,occurred_at,home_score,away_score,winner,stats_summary,source,revision,"
               "supersedes_outcome_id,hash) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.outcome_id);
  BindText(st.get(), 2, r.game_id);
  BindTime(st.get(), 3, r.occurred_at);
  BindI64(st.get(), 4, r.final_score.home);
  BindI64(st.get(), 5, r.final_score.away);
  BindOptText(st.get(), 6, r.winner);
  BindText(st.get(), 7, util::ToJson(r.stats_summary));
  BindText(st.get(), 8, r.source);
  BindI64(st.get(), 9, r.revision);
  BindOptText(st.get(), 10, r.supersedes_outcome_id);
  BindText(st.get(), 11, r.hash);

  return Translate(db, st.Step());
}

std::vector<model::Outcome> SqliteRepository::QueryOutcomes(Transaction& t, const std::string& where,
                                                            const std::vector<std::string>& params) {
  Statement st(TX(t).Handle(), std::string(kOutcomeColumns) + " " + where + ";");
  for (size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Outcome> out;
  while (st.Next()) {
    model::Outcome r;
    r.outcome_id            = ColText(st.get(), 0);
    r.game_id               = ColText(st.get(), 1);
    r.occurred_at           = ColTime(st.get(), 2);
    r.final_score.home      = ColI64(st.get(), 3);
    r.final_score.away      = ColI64(st.get(), 4);
    r.winner                = ColOptText(st.get(), 5);
    r.stats_summary         = util::ParseStruct(ColText(st.get(), 6));
    r.source                = ColText(st.get(), 7);
    r.revision              = ColI64(st.get(), 8);
    r.supersedes_outcome_id = ColOptText(st.get(), 9);
    r.hash                  = ColText(st.get(), 10);
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<model::Outcome> SqliteRepository::GetOutcome(Transaction& t, const std::string& id) {
  return First(QueryOutcomes(t, "WHERE outcome_id=?", {id}));
}

std::optional<model::Outcome> SqliteRepository::FindOutcomeByHash(Transaction& t, const std::string& hash) {
  return First(QueryOutcomes(t, "WHERE hash=?", {hash}));
}

std::vector<model::Outcome> SqliteRepository::ListOutcomes(Transaction& t) {
  return QueryOutcomes(t, "ORDER BY game_id, revision", {});
}

std::vector<model::Outcome> SqliteRepository::ListOutcomesByGame(Transaction& t, const std::string& game_id) {
  return QueryOutcomes(t, "WHERE game_id=? ORDER BY revision", {game_id});
}

// ------------------------------------------------------------------
// Evaluations
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvaluation(Transaction& t, const model::Evaluation& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO evaluations(evaluation_id,analysis_id,outcome_id,game_id,scored_at,brier_score,log_loss,roi,"
               "edge_realized,notes,hash) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.evaluation_id);
  BindText(st.get(), 2, r.analysis_id);
  BindText(st.get(), 3, r.outcome_id);
  BindText(st.get(), 4, r.game_id);
  BindTime(st.get(), 5, r.scored_at);
  BindOptDouble(st.get(), 6, r.metrics.brier_score);
  BindOptDouble(st.get(), 7, r.metrics.log_loss);
  BindOptDouble(st.get(), 8, r.metrics.roi);
  BindText(st.get(), 9, std::string(model::ToString(r.metrics.edge_realized)));
  BindText(st.get(), 10, util::ToJson(r.notes));
  BindText(st.get(), 11, r.hash);

  return Translate(db, st.Step());
}

std::vector<model::Evaluation> SqliteRepository::QueryEvaluations(Transaction& t, const std::string& where,
                                                                  const std::vector<std::string>& params) {
  Statement st(TX(t).Handle(), std::string(kEvaluationColumns) + " " + where + ";");
  for (size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::Evaluation> out;
  while (st.Next()) {
    model::Evaluation r;
    r.evaluation_id         = ColText(st.get(), 0);
    r.analysis_id           = ColText(st.get(), 1);
    r.outcome_id            = ColText(st.get(), 2);
    r.game_id               = ColText(st.get(), 3);
    r.scored_at             = ColTime(st.get(), 4);
    r.metrics.brier_score   = ColOptDouble(st.get(), 5);
    r.metrics.log_loss      = ColOptDouble(st.get(), 6);
    r.metrics.roi           = ColOptDouble(st.get(), 7);
    r.metrics.edge_realized = model::ParseEdgeRealized(ColText(st.get(), 8));
    r.notes                 = util::ParseStruct(ColText(st.get(), 9));
    r.hash                  = ColText(st.get(), 10);
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<model::Evaluation> SqliteRepository::GetEvaluation(Transaction& t, const std::string& id) {
  return First(QueryEvaluations(t, "WHERE evaluation_id=?", {id}));
}

std::optional<model::Evaluation> SqliteRepository::FindEvaluationByHash(Transaction& t, const std::string& hash) {
  return First(QueryEvaluations(t, "WHERE hash=?", {hash}));
}

std::vector<model::Evaluation> SqliteRepository::ListEvaluations(Transaction& t) {
  return QueryEvaluations(t, "ORDER BY scored_at, evaluation_id", {});
}

std::vector<model::Evaluation> SqliteRepository::ListEvaluationsByAnalysis(Transaction& t, const std::string& analysis_id) {
  return QueryEvaluations(t, "WHERE analysis_id=? ORDER BY scored_at, evaluation_id", {analysis_id});
}

// ------------------------------------------------------------------
// Proposals
// ------------------------------------------------------------------

Result SqliteRepository::InsertProposal(Transaction& t, const model::ImprovementProposal& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO improvement_proposals(proposal_id,created_at,proposal_text,suggested_schema_additions,"
               "suggested_modules,expected_impact,status,hash) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.proposal_id);
  BindTime(st.get(), 2, r.created_at);
  BindText(st.get(), 3, r.proposal_text);
  BindText(st.get(), 4, util::ToJson(r.suggested_schema_additions));
  BindText(st.get(), 5, util::ToJson(r.suggested_modules));
  BindText(st.get(), 6, r.expected_impact);
  BindText(st.get(), 7, std::string(model::ToString(r.status)));
  BindText(st.get(), 8, r.hash);

  auto result = Translate(db, st.Step());
  if (!result) return result;

  Statement join(db, "INSERT INTO proposal_evaluations(proposal_id,evaluation_id,position) VALUES(?,?,?);");
  for (size_t i = 0; i < r.based_on_evaluation_ids.size(); ++i) {
    sqlite3_reset(join.get());
    BindText(join.get(), 1, r.proposal_id);
    BindText(join.get(), 2, r.based_on_evaluation_ids[i]);
    BindI64(join.get(), 3, static_cast<int64_t>(i));
    result = Translate(db, join.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::ImprovementProposal> SqliteRepository::QueryProposals(Transaction& t, const std::string& where,
                                                                         const std::vector<std::string>& params) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string(kProposalColumns) + " " + where + ";");
  for (size_t i = 0; i < params.size(); ++i) {
    BindText(st.get(), static_cast<int>(i + 1), params[i]);
  }

  std::vector<model::ImprovementProposal> out;
  while (st.Next()) {
    model::ImprovementProposal r;
    r.proposal_id                = ColText(st.get(), 0);
    r.created_at                 = ColTime(st.get(), 1);
    r.proposal_text              = ColText(st.get(), 2);
    r.suggested_schema_additions = util::ParseList(ColText(st.get(), 3));
    r.suggested_modules          = util::ParseList(ColText(st.get(), 4));
    r.expected_impact            = ColText(st.get(), 5);
    r.status                     = model::ParseProposalStatus(ColText(st.get(), 6));
    r.hash                       = ColText(st.get(), 7);
    out.push_back(std::move(r));
  }

  Statement evidence(db, "SELECT evaluation_id FROM proposal_evaluations WHERE proposal_id=? ORDER BY position;");
  for (auto& proposal : out) {
    sqlite3_reset(evidence.get());
    BindText(evidence.get(), 1, proposal.proposal_id);
    while (evidence.Next()) {
      proposal.based_on_evaluation_ids.push_back(ColText(evidence.get(), 0));
    }
  }
  return out;
}

std::optional<model::ImprovementProposal> SqliteRepository::GetProposal(Transaction& t, const std::string& id) {
  return First(QueryProposals(t, "WHERE proposal_id=?", {id}));
}

std::optional<model::ImprovementProposal> SqliteRepository::FindProposalByHash(Transaction& t, const std::string& hash) {
  return First(QueryProposals(t, "WHERE hash=? ORDER BY created_at, proposal_id LIMIT 1", {hash}));
}

std::vector<model::ImprovementProposal> SqliteRepository::ListProposals(Transaction& t) {
  return QueryProposals(t, "ORDER BY created_at, proposal_id", {});
}

Result SqliteRepository::UpdateProposalStatus(Transaction& t, const std::string& id, model::ProposalStatus status,
                                              const std::string& hash) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE improvement_proposals SET status=?, hash=? WHERE proposal_id=?;");
  BindText(st.get(), 1, std::string(model::ToString(status)));
  BindText(st.get(), 2, hash);
  BindText(st.get(), 3, id);

  auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "proposal " + id);
  return Result::Ok();
}

} // namespace sportsledger::db::sqlite
