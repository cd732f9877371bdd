#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace sportsledger::db::memory {

class MemoryTransaction;

/*
  In-process repository used for tests and ephemeral runs.

  Committed state is copied into each transaction and swapped back on
  commit. Transactions hold the repository's writer lock for their whole
  lifetime, so they never conflict.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::Snapshot> snapshots;
    std::unordered_map<std::string, std::string> snapshot_by_hash;

    std::map<std::string, model::Analysis> analyses;
    std::unordered_map<std::string, std::string> analysis_by_hash;

    std::map<std::string, model::Outcome> outcomes;
    std::unordered_map<std::string, std::string> outcome_by_hash;

    std::map<std::string, model::Evaluation> evaluations;
    std::unordered_map<std::string, std::string> evaluation_by_hash;

    // proposal hashes follow status and are not unique
    std::map<std::string, model::ImprovementProposal> proposals;
  };

  std::mutex writer_mutex_;
  std::mutex mutex_;
  State committed_;
};

}
