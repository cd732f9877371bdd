#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/records.hpp"

namespace sportsledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Insert is the only write for every entity; there is no update or
    delete, except UpdateProposalStatus which touches status + hash only
  - An analysis and its snapshot join rows (a proposal and its evaluation
    join rows) are written together by one Insert call

  Repositories store what they are given. Hash computation, verification
  and referential checks are the store's job; the repository only enforces
  primary keys and hash uniqueness.

  Lists return records in a stable order:
    snapshots   by (collected_at, snapshot_id)
    analyses    by (created_at, analysis_id)
    outcomes    by (game_id, revision)
    evaluations by (scored_at, evaluation_id)
    proposals   by (created_at, proposal_id)
*/

// Identity of a stored row, read without decoding its content.
struct RecordKey {
  std::string id;
  std::string hash;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Every row of one entity, in that entity's list order. Content columns
  // are not read, so a row whose content no longer decodes is still listed.
  virtual std::vector<RecordKey> ListRecordKeys(Transaction&, model::EntityType entity) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::Snapshot&) = 0;

  virtual std::optional<model::Snapshot> GetSnapshot(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::Snapshot> FindSnapshotByHash(Transaction&, const std::string& hash) = 0;

  virtual std::vector<model::Snapshot> ListSnapshots(Transaction&) = 0;

  // Snapshots of one game, optionally only those collected at or before as_of.
  virtual std::vector<model::Snapshot> ListSnapshotsByGame(Transaction&, const std::string& game_id,
                                                           std::optional<util::TimePoint> as_of) = 0;

  virtual std::vector<std::string> ListGameIds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Analyses
  // ---------------------------------------------------------------------

  virtual Result InsertAnalysis(Transaction&, const model::Analysis&) = 0;

  virtual std::optional<model::Analysis> GetAnalysis(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::Analysis> FindAnalysisByHash(Transaction&, const std::string& hash) = 0;

  virtual std::vector<model::Analysis> ListAnalyses(Transaction&) = 0;

  virtual std::vector<model::Analysis> ListChildAnalyses(Transaction&, const std::string& parent_id) = 0;

  // ---------------------------------------------------------------------
  // Outcomes
  // ---------------------------------------------------------------------

  virtual Result InsertOutcome(Transaction&, const model::Outcome&) = 0;

  virtual std::optional<model::Outcome> GetOutcome(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::Outcome> FindOutcomeByHash(Transaction&, const std::string& hash) = 0;

  virtual std::vector<model::Outcome> ListOutcomes(Transaction&) = 0;

  // All revisions for a game, oldest first.
  virtual std::vector<model::Outcome> ListOutcomesByGame(Transaction&, const std::string& game_id) = 0;

  // ---------------------------------------------------------------------
  // Evaluations
  // ---------------------------------------------------------------------

  virtual Result InsertEvaluation(Transaction&, const model::Evaluation&) = 0;

  virtual std::optional<model::Evaluation> GetEvaluation(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::Evaluation> FindEvaluationByHash(Transaction&, const std::string& hash) = 0;

  virtual std::vector<model::Evaluation> ListEvaluations(Transaction&) = 0;

  virtual std::vector<model::Evaluation> ListEvaluationsByAnalysis(Transaction&, const std::string& analysis_id) = 0;

  // ---------------------------------------------------------------------
  // Improvement proposals
  // ---------------------------------------------------------------------

  virtual Result InsertProposal(Transaction&, const model::ImprovementProposal&) = 0;

  virtual std::optional<model::ImprovementProposal> GetProposal(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ImprovementProposal> FindProposalByHash(Transaction&, const std::string& hash) = 0;

  virtual std::vector<model::ImprovementProposal> ListProposals(Transaction&) = 0;

  // The single mutation path: writes status and hash, nothing else.
  virtual Result UpdateProposalStatus(Transaction&, const std::string& id, model::ProposalStatus status, const std::string& hash) = 0;
};

} // namespace sportsledger::db
