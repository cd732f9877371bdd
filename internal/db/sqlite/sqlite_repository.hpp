#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sportsledger::db::sqlite {

/*
  SQLite-backed ledger repository.

  Free-form record content (Struct / ListValue) is stored as JSON text,
  timestamps as fixed-width RFC3339 text. Constraint aborts raised by the
  immutability triggers come back as ErrorCode::ImmutableViolation.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::vector<RecordKey> ListRecordKeys(Transaction&, model::EntityType entity) override;

  Result InsertSnapshot(Transaction&, const model::Snapshot&) override;
  std::optional<model::Snapshot> GetSnapshot(Transaction&, const std::string&) override;
  std::optional<model::Snapshot> FindSnapshotByHash(Transaction&, const std::string&) override;
  std::vector<model::Snapshot> ListSnapshots(Transaction&) override;
  std::vector<model::Snapshot> ListSnapshotsByGame(Transaction&, const std::string& game_id,
                                                   std::optional<util::TimePoint> as_of) override;
  std::vector<std::string> ListGameIds(Transaction&) override;

  Result InsertAnalysis(Transaction&, const model::Analysis&) override;
  std::optional<model::Analysis> GetAnalysis(Transaction&, const std::string&) override;
  std::optional<model::Analysis> FindAnalysisByHash(Transaction&, const std::string&) override;
  std::vector<model::Analysis> ListAnalyses(Transaction&) override;
  std::vector<model::Analysis> ListChildAnalyses(Transaction&, const std::string& parent_id) override;

  Result InsertOutcome(Transaction&, const model::Outcome&) override;
  std::optional<model::Outcome> GetOutcome(Transaction&, const std::string&) override;
  std::optional<model::Outcome> FindOutcomeByHash(Transaction&, const std::string&) override;
  std::vector<model::Outcome> ListOutcomes(Transaction&) override;
  std::vector<model::Outcome> ListOutcomesByGame(Transaction&, const std::string& game_id) override;

  Result InsertEvaluation(Transaction&, const model::Evaluation&) override;
  std::optional<model::Evaluation> GetEvaluation(Transaction&, const std::string&) override;
  std::optional<model::Evaluation> FindEvaluationByHash(Transaction&, const std::string&) override;
  std::vector<model::Evaluation> ListEvaluations(Transaction&) override;
  std::vector<model::Evaluation> ListEvaluationsByAnalysis(Transaction&, const std::string& analysis_id) override;

  Result InsertProposal(Transaction&, const model::ImprovementProposal&) override;
  std::optional<model::ImprovementProposal> GetProposal(Transaction&, const std::string&) override;
  std::optional<model::ImprovementProposal> FindProposalByHash(Transaction&, const std::string&) override;
  std::vector<model::ImprovementProposal> ListProposals(Transaction&) override;
  Result UpdateProposalStatus(Transaction&, const std::string& id, model::ProposalStatus status,
                              const std::string& hash) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::Snapshot> QuerySnapshots(Transaction&, const std::string& where, const std::vector<std::string>& params);
  std::vector<model::Analysis> QueryAnalyses(Transaction&, const std::string& where, const std::vector<std::string>& params);
  std::vector<model::Outcome> QueryOutcomes(Transaction&, const std::string& where, const std::vector<std::string>& params);
  std::vector<model::Evaluation> QueryEvaluations(Transaction&, const std::string& where, const std::vector<std::string>& params);
  std::vector<model::ImprovementProposal> QueryProposals(Transaction&, const std::string& where,
                                                         const std::vector<std::string>& params);

  std::shared_ptr<SqliteDB> db_;
};

}
