#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/records.hpp"

namespace sportsledger::store {

/*
  ImmutableStore

  Append-only ledger over a db::Repository. The public surface is insert
  and read; the one mutation is the forward-only proposal status
  transition.

  Insert, for every entity:
    1. validate caller input (std::invalid_argument)
    2. compute the content hash; a carried hash that disagrees is a
       util::HashMismatchError
    3. serialize on the record's logical key (hash, or game_id for
       outcomes)
    4. in one transaction: return the existing record if the hash is
       already stored, otherwise check references, write, commit

  Every read re-verifies the stored hash.
*/
class ImmutableStore {
 public:
  explicit ImmutableStore(std::shared_ptr<db::Repository> repository);

  model::Snapshot            Insert(model::Snapshot snapshot);
  model::Analysis            Insert(model::Analysis analysis);
  model::Outcome             Insert(model::Outcome outcome);
  model::Evaluation          Insert(model::Evaluation evaluation);
  model::ImprovementProposal Insert(model::ImprovementProposal proposal);

  model::Snapshot            GetSnapshot(const std::string& id);
  model::Analysis            GetAnalysis(const std::string& id);
  model::Outcome             GetOutcome(const std::string& id);
  model::Evaluation          GetEvaluation(const std::string& id);
  model::ImprovementProposal GetProposal(const std::string& id);

  // Timeline of a game ordered by collected_at. With as_of, only what was
  // known at or before that instant.
  std::vector<model::Snapshot>   ListByGame(const std::string& game_id, std::optional<util::TimePoint> as_of = std::nullopt);
  std::optional<model::Snapshot> LatestSnapshot(const std::string& game_id, std::optional<util::TimePoint> as_of = std::nullopt);
  std::vector<std::string>       ListGames();

  std::vector<model::Analysis> ListAnalyses();
  std::vector<model::Analysis> ListChildren(const std::string& analysis_id);

  // Root-first chain of analyses ending at analysis_id.
  std::vector<model::Analysis> ListLineagePath(const std::string& analysis_id);

  // Game an analysis is about, derived from its input snapshots.
  std::string GameOfAnalysis(const model::Analysis& analysis);

  // Highest revision reported for the game, if any.
  std::optional<model::Outcome> CurrentOutcome(const std::string& game_id);
  std::vector<model::Outcome>   ListOutcomes();
  std::vector<model::Outcome>   ListOutcomes(const std::string& game_id);

  std::vector<model::Evaluation> ListEvaluations();
  std::vector<model::Evaluation> ListEvaluations(const std::string& analysis_id);

  std::vector<model::ImprovementProposal> ListProposals();

  // Throws util::InvalidTransitionError for anything but a forward move.
  model::ImprovementProposal UpdateProposalStatus(const std::string& proposal_id, model::ProposalStatus status);

  // Ledger records cannot be changed or removed; these always throw
  // util::ImmutabilityViolationError.
  [[noreturn]] void Update(model::EntityType entity, const std::string& id, const std::string& field);
  [[noreturn]] void Remove(model::EntityType entity, const std::string& id);

  db::Repository& repository() {
    return *repository_;
  }

 private:
  static constexpr std::size_t kKeyLockStripes = 64;

  // Serializes writers of one logical key. Keys hash onto a fixed set of
  // stripes, so unrelated keys may share a lock; callers hold one at a time.
  std::unique_lock<std::mutex> LockKey(const std::string& key);

  std::shared_ptr<db::Repository> repository_;

  std::array<std::mutex, kKeyLockStripes> key_locks_;
};

} // namespace sportsledger::store
