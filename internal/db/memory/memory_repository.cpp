#include "memory_repository.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include "memory_tx.hpp"

namespace sportsledger::db::memory {

namespace {

template <typename Record>
std::optional<Record> FindById(const std::map<std::string, Record>& table, const std::string& id) {
  auto it = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

template <typename Record>
std::optional<Record> FindByHash(const std::map<std::string, Record>& table, const std::unordered_map<std::string, std::string>& index,
                                 const std::string& hash) {
  auto it = index.find(hash);
  if (it == index.end()) return std::nullopt;
  return FindById(table, it->second);
}

template <typename Record, typename Pred>
std::vector<Record> Select(const std::map<std::string, Record>& table, Pred pred) {
  std::vector<Record> out;
  for (const auto& [_, record] : table) {
    if (pred(record)) out.push_back(record);
  }
  return out;
}

bool SnapshotOrder(const model::Snapshot& a, const model::Snapshot& b) {
  return std::tie(a.collected_at, a.snapshot_id) < std::tie(b.collected_at, b.snapshot_id);
}

bool AnalysisOrder(const model::Analysis& a, const model::Analysis& b) {
  return std::tie(a.created_at, a.analysis_id) < std::tie(b.created_at, b.analysis_id);
}

bool OutcomeOrder(const model::Outcome& a, const model::Outcome& b) {
  return std::tie(a.game_id, a.revision) < std::tie(b.game_id, b.revision);
}

bool EvaluationOrder(const model::Evaluation& a, const model::Evaluation& b) {
  return std::tie(a.scored_at, a.evaluation_id) < std::tie(b.scored_at, b.evaluation_id);
}

bool ProposalOrder(const model::ImprovementProposal& a, const model::ImprovementProposal& b) {
  return std::tie(a.created_at, a.proposal_id) < std::tie(b.created_at, b.proposal_id);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Record, typename IdOf>
static std::vector<RecordKey> KeysOf(const std::vector<Record>& records, IdOf id_of) {
  std::vector<RecordKey> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(RecordKey{id_of(record), record.hash});
  }
  return out;
}

std::vector<RecordKey> MemoryRepository::ListRecordKeys(Transaction& t, model::EntityType entity) {
  switch (entity) {
    case model::EntityType::kSnapshot:
      return KeysOf(ListSnapshots(t), [](const model::Snapshot& r) { return r.snapshot_id; });
    case model::EntityType::kAnalysis:
      return KeysOf(ListAnalyses(t), [](const model::Analysis& r) { return r.analysis_id; });
    case model::EntityType::kOutcome:
      return KeysOf(ListOutcomes(t), [](const model::Outcome& r) { return r.outcome_id; });
    case model::EntityType::kEvaluation:
      return KeysOf(ListEvaluations(t), [](const model::Evaluation& r) { return r.evaluation_id; });
    case model::EntityType::kProposal:
      return KeysOf(ListProposals(t), [](const model::ImprovementProposal& r) { return r.proposal_id; });
  }
  return {};
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::Snapshot& r) {
  auto& s = TX(t).Mutable();
  if (s.snapshots.contains(r.snapshot_id)) return Result::Err(ErrorCode::AlreadyExists, "snapshot id exists");
  if (s.snapshot_by_hash.contains(r.hash)) return Result::Err(ErrorCode::AlreadyExists, "snapshot hash exists");
  s.snapshots[r.snapshot_id] = r;
  s.snapshot_by_hash[r.hash] = r.snapshot_id;
  return Result::Ok();
}

std::optional<model::Snapshot> MemoryRepository::GetSnapshot(Transaction& t, const std::string& id) {
  return FindById(TX(t).View().snapshots, id);
}

std::optional<model::Snapshot> MemoryRepository::FindSnapshotByHash(Transaction& t, const std::string& hash) {
  const auto& s = TX(t).View();
  return FindByHash(s.snapshots, s.snapshot_by_hash, hash);
}

std::vector<model::Snapshot> MemoryRepository::ListSnapshots(Transaction& t) {
  auto out = Select(TX(t).View().snapshots, [](const model::Snapshot&) { return true; });
  std::sort(out.begin(), out.end(), SnapshotOrder);
  return out;
}

std::vector<model::Snapshot> MemoryRepository::ListSnapshotsByGame(Transaction& t, const std::string& game_id,
                                                                   std::optional<util::TimePoint> as_of) {
  auto out = Select(TX(t).View().snapshots, [&](const model::Snapshot& snapshot) {
    return snapshot.game_id == game_id && (!as_of || snapshot.collected_at <= *as_of);
  });
  std::sort(out.begin(), out.end(), SnapshotOrder);
  return out;
}

std::vector<std::string> MemoryRepository::ListGameIds(Transaction& t) {
  std::set<std::string> ids;
  for (const auto& [_, snapshot] : TX(t).View().snapshots) {
    ids.insert(snapshot.game_id);
  }
  return {ids.begin(), ids.end()};
}

// ------------------------------------------------------------------
// Analyses
// ------------------------------------------------------------------

Result MemoryRepository::InsertAnalysis(Transaction& t, const model::Analysis& r) {
  auto& s = TX(t).Mutable();
  if (s.analyses.contains(r.analysis_id)) return Result::Err(ErrorCode::AlreadyExists, "analysis id exists");
  if (s.analysis_by_hash.contains(r.hash)) return Result::Err(ErrorCode::AlreadyExists, "analysis hash exists");
  for (const auto& snapshot_id : r.input_snapshot_ids) {
    if (!s.snapshots.contains(snapshot_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown snapshot " + snapshot_id);
  }
  if (r.parent_analysis_id && !s.analyses.contains(*r.parent_analysis_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent " + *r.parent_analysis_id);
  }
  s.analyses[r.analysis_id] = r;
  s.analysis_by_hash[r.hash] = r.analysis_id;
  return Result::Ok();
}

std::optional<model::Analysis> MemoryRepository::GetAnalysis(Transaction& t, const std::string& id) {
  return FindById(TX(t).View().analyses, id);
}

std::optional<model::Analysis> MemoryRepository::FindAnalysisByHash(Transaction& t, const std::string& hash) {
  const auto& s = TX(t).View();
  return FindByHash(s.analyses, s.analysis_by_hash, hash);
}

std::vector<model::Analysis> MemoryRepository::ListAnalyses(Transaction& t) {
  auto out = Select(TX(t).View().analyses, [](const model::Analysis&) { return true; });
  std::sort(out.begin(), out.end(), AnalysisOrder);
  return out;
}

std::vector<model::Analysis> MemoryRepository::ListChildAnalyses(Transaction& t, const std::string& parent_id) {
  auto out = Select(TX(t).View().analyses,
                    [&](const model::Analysis& analysis) { return analysis.parent_analysis_id == parent_id; });
  std::sort(out.begin(), out.end(), AnalysisOrder);
  return out;
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Result MemoryRepository::InsertOutcome(Transaction& t, const model::Outcome& r) {
  auto& s = TX(t).Mutable();
  if (s.outcomes.contains(r.outcome_id)) return Result::Err(ErrorCode::AlreadyExists, "outcome id exists");
  if (s.outcome_by_hash.contains(r.hash)) return Result::Err(ErrorCode::AlreadyExists, "outcome hash exists");
  for (const auto& [_, existing] : s.outcomes) {
    if (existing.game_id == r.game_id && existing.revision == r.revision) {
      return Result::Err(ErrorCode::AlreadyExists, "outcome revision exists for game " + r.game_id);
    }
  }
  s.outcomes[r.outcome_id] = r;
  s.outcome_by_hash[r.hash] = r.outcome_id;
  return Result::Ok();
}

std::optional<model::Outcome> MemoryRepository::GetOutcome(Transaction& t, const std::string& id) {
  return FindById(TX(t).View().outcomes, id);
}

std::optional<model::Outcome> MemoryRepository::FindOutcomeByHash(Transaction& t, const std::string& hash) {
  const auto& s = TX(t).View();
  return FindByHash(s.outcomes, s.outcome_by_hash, hash);
}

std::vector<model::Outcome> MemoryRepository::ListOutcomes(Transaction& t) {
  auto out = Select(TX(t).View().outcomes, [](const model::Outcome&) { return true; });
  std::sort(out.begin(), out.end(), OutcomeOrder);
  return out;
}

std::vector<model::Outcome> MemoryRepository::ListOutcomesByGame(Transaction& t, const std::string& game_id) {
  auto out = Select(TX(t).View().outcomes, [&](const model::Outcome& outcome) { return outcome.game_id == game_id; });
  std::sort(out.begin(), out.end(), OutcomeOrder);
  return out;
}

// ------------------------------------------------------------------
// Evaluations
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvaluation(Transaction& t, const model::Evaluation& r) {
  auto& s = TX(t).Mutable();
  if (s.evaluations.contains(r.evaluation_id)) return Result::Err(ErrorCode::AlreadyExists, "evaluation id exists");
  if (s.evaluation_by_hash.contains(r.hash)) return Result::Err(ErrorCode::AlreadyExists, "evaluation hash exists");
  if (!s.analyses.contains(r.analysis_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown analysis " + r.analysis_id);
  if (!s.outcomes.contains(r.outcome_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown outcome " + r.outcome_id);
  s.evaluations[r.evaluation_id] = r;
  s.evaluation_by_hash[r.hash] = r.evaluation_id;
  return Result::Ok();
}

std::optional<model::Evaluation> MemoryRepository::GetEvaluation(Transaction& t, const std::string& id) {
  return FindById(TX(t).View().evaluations, id);
}

std::optional<model::Evaluation> MemoryRepository::FindEvaluationByHash(Transaction& t, const std::string& hash) {
  const auto& s = TX(t).View();
  return FindByHash(s.evaluations, s.evaluation_by_hash, hash);
}

std::vector<model::Evaluation> MemoryRepository::ListEvaluations(Transaction& t) {
  auto out = Select(TX(t).View().evaluations, [](const model::Evaluation&) { return true; });
  std::sort(out.begin(), out.end(), EvaluationOrder);
  return out;
}

std::vector<model::Evaluation> MemoryRepository::ListEvaluationsByAnalysis(Transaction& t, const std::string& analysis_id) {
  auto out = Select(TX(t).View().evaluations,
                    [&](const model::Evaluation& evaluation) { return evaluation.analysis_id == analysis_id; });
  std::sort(out.begin(), out.end(), EvaluationOrder);
  return out;
}

// ------------------------------------------------------------------
// Proposals
// ------------------------------------------------------------------

Result MemoryRepository::InsertProposal(Transaction& t, const model::ImprovementProposal& r) {
  auto& s = TX(t).Mutable();
  if (s.proposals.contains(r.proposal_id)) return Result::Err(ErrorCode::AlreadyExists, "proposal id exists");
  for (const auto& evaluation_id : r.based_on_evaluation_ids) {
    if (!s.evaluations.contains(evaluation_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "unknown evaluation " + evaluation_id);
    }
  }
  s.proposals[r.proposal_id] = r;
  return Result::Ok();
}

std::optional<model::ImprovementProposal> MemoryRepository::GetProposal(Transaction& t, const std::string& id) {
  return FindById(TX(t).View().proposals, id);
}

std::optional<model::ImprovementProposal> MemoryRepository::FindProposalByHash(Transaction& t, const std::string& hash) {
  auto matches = Select(TX(t).View().proposals, [&](const model::ImprovementProposal& proposal) { return proposal.hash == hash; });
  if (matches.empty()) return std::nullopt;
  std::sort(matches.begin(), matches.end(), ProposalOrder);
  return matches.front();
}

std::vector<model::ImprovementProposal> MemoryRepository::ListProposals(Transaction& t) {
  auto out = Select(TX(t).View().proposals, [](const model::ImprovementProposal&) { return true; });
  std::sort(out.begin(), out.end(), ProposalOrder);
  return out;
}

Result MemoryRepository::UpdateProposalStatus(Transaction& t, const std::string& id, model::ProposalStatus status,
                                              const std::string& hash) {
  auto& s  = TX(t).Mutable();
  auto  it = s.proposals.find(id);
  if (it == s.proposals.end()) return Result::Err(ErrorCode::NotFound, "proposal " + id);
  it->second.status = status;
  it->second.hash   = hash;
  return Result::Ok();
}

} // namespace sportsledger::db::memory
