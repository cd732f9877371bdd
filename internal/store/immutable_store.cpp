#include "internal/store/immutable_store.hpp"

#include <cmath>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/lineage/lineage_graph.hpp"
#include "internal/model/record_hash.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sportsledger::store {
namespace {

using model::EntityType;
using observability::StringField;

std::string Name(EntityType entity) {
  return std::string(model::EntityName(entity));
}

void ThrowIfDbError(const db::Result& result, EntityType entity, const std::string& key, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::UniquenessError(Name(entity), key);
    case db::ErrorCode::NotFound:
      throw util::NotFoundError(Name(entity), key);
    case db::ErrorCode::ConstraintViolation:
      throw util::ReferentialError(Name(entity), key, message);
    case db::ErrorCode::ImmutableViolation:
      throw util::ImmutabilityViolationError(context, Name(entity));
    default:
      throw std::runtime_error(message + " [" + std::string(db::ToString(result.code)) + "]");
  }
}

// Re-verifies a record read from storage.
template <typename Record>
const Record& Verified(const Record& record, EntityType entity, const std::string& id) {
  const auto actual = model::ComputeHash(record);
  if (actual != record.hash) {
    SPORTSLEDGER_LOG_ERROR("Hash mismatch", {StringField("entity", Name(entity)), StringField("id", id),
                                             StringField("expected", record.hash), StringField("actual", actual)});
    throw util::HashMismatchError(Name(entity), id, record.hash, actual);
  }
  return record;
}

template <typename Record>
std::string AssignHash(Record& record, EntityType entity, const std::string& id) {
  const auto computed = model::ComputeHash(record);
  if (!record.hash.empty() && record.hash != computed) {
    SPORTSLEDGER_LOG_ERROR("Rejected record with inconsistent hash",
                           {StringField("entity", Name(entity)), StringField("id", id.empty() ? "<new>" : id)});
    throw util::HashMismatchError(Name(entity), id.empty() ? "<new>" : id, record.hash, computed);
  }
  record.hash = computed;
  return computed;
}

void RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
}

void RequireUnique(const std::vector<std::string>& ids, const char* what) {
  std::unordered_set<std::string> seen;
  for (const auto& id : ids) {
    RequireNonEmpty(id, what);
    if (!seen.insert(id).second) {
      throw std::invalid_argument(std::string(what) + " contains duplicate id " + id);
    }
  }
}

void RequireProbabilityMetric(const std::optional<double>& value, const char* what, double upper) {
  if (!value) return;
  if (!std::isfinite(*value) || *value < 0.0 || *value > upper) {
    throw std::invalid_argument(std::string(what) + " out of range");
  }
}

util::TimePoint StampOrNow(util::TimePoint tp) {
  return tp == util::TimePoint{} ? util::Now() : util::TruncateToMicros(tp);
}

void LogStored(EntityType entity, const std::string& id, const std::string& hash) {
  SPORTSLEDGER_LOG_INFO("Record inserted", {StringField("entity", Name(entity)), StringField("id", id), StringField("hash", hash)});
}

void LogDeduplicated(EntityType entity, const std::string& id, const std::string& hash) {
  SPORTSLEDGER_LOG_INFO("Record already stored", {StringField("entity", Name(entity)), StringField("id", id), StringField("hash", hash)});
}

[[noreturn]] void RejectReference(EntityType entity, const std::string& id, const std::string& detail) {
  SPORTSLEDGER_LOG_WARN("Rejected insert", {StringField("entity", Name(entity)), StringField("id", id), StringField("reason", detail)});
  throw util::ReferentialError(Name(entity), id, detail);
}

} // namespace

ImmutableStore::ImmutableStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("immutable store requires a repository");
  }
}

std::unique_lock<std::mutex> ImmutableStore::LockKey(const std::string& key) {
  return std::unique_lock<std::mutex>(key_locks_[std::hash<std::string>{}(key) % key_locks_.size()]);
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

model::Snapshot ImmutableStore::Insert(model::Snapshot snapshot) {
  RequireNonEmpty(snapshot.game_id, "snapshot game_id");
  RequireNonEmpty(snapshot.schema_version, "snapshot schema_version");
  snapshot.collected_at = StampOrNow(snapshot.collected_at);

  const auto hash = AssignHash(snapshot, EntityType::kSnapshot, snapshot.snapshot_id);
  auto       lock = LockKey("snapshot:" + hash);
  auto       tx   = repository_->Begin();

  if (auto existing = repository_->FindSnapshotByHash(*tx, hash)) {
    LogDeduplicated(EntityType::kSnapshot, existing->snapshot_id, hash);
    return Verified(*existing, EntityType::kSnapshot, existing->snapshot_id);
  }

  if (snapshot.snapshot_id.empty()) snapshot.snapshot_id = util::NewId();
  ThrowIfDbError(repository_->InsertSnapshot(*tx, snapshot), EntityType::kSnapshot, snapshot.snapshot_id, "insert snapshot");
  tx->Commit();

  LogStored(EntityType::kSnapshot, snapshot.snapshot_id, hash);
  return snapshot;
}

model::Snapshot ImmutableStore::GetSnapshot(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSnapshot(*tx, id);
  if (!record) throw util::NotFoundError("snapshot", id);
  return Verified(*record, EntityType::kSnapshot, id);
}

std::vector<model::Snapshot> ImmutableStore::ListByGame(const std::string& game_id, std::optional<util::TimePoint> as_of) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSnapshotsByGame(*tx, game_id, as_of);
  for (const auto& record : records) {
    Verified(record, EntityType::kSnapshot, record.snapshot_id);
  }
  return records;
}

std::optional<model::Snapshot> ImmutableStore::LatestSnapshot(const std::string& game_id, std::optional<util::TimePoint> as_of) {
  auto timeline = ListByGame(game_id, as_of);
  if (timeline.empty()) return std::nullopt;
  return std::move(timeline.back());
}

std::vector<std::string> ImmutableStore::ListGames() {
  auto tx = repository_->Begin();
  return repository_->ListGameIds(*tx);
}

// ------------------------------------------------------------------
// Analyses
// ------------------------------------------------------------------

model::Analysis ImmutableStore::Insert(model::Analysis analysis) {
  RequireNonEmpty(analysis.analysis_version, "analysis_version");
  RequireNonEmpty(analysis.code_version, "code_version");
  if (analysis.input_snapshot_ids.empty()) {
    throw std::invalid_argument("analysis requires at least one input snapshot");
  }
  RequireUnique(analysis.input_snapshot_ids, "input_snapshot_ids");
  if (analysis.parent_analysis_id) {
    RequireNonEmpty(*analysis.parent_analysis_id, "parent_analysis_id");
  }
  analysis.created_at = StampOrNow(analysis.created_at);

  const auto hash = AssignHash(analysis, EntityType::kAnalysis, analysis.analysis_id);
  auto       lock = LockKey("analysis:" + hash);
  auto       tx   = repository_->Begin();

  if (auto existing = repository_->FindAnalysisByHash(*tx, hash)) {
    LogDeduplicated(EntityType::kAnalysis, existing->analysis_id, hash);
    return Verified(*existing, EntityType::kAnalysis, existing->analysis_id);
  }

  if (analysis.analysis_id.empty()) analysis.analysis_id = util::NewId();
  if (analysis.parent_analysis_id == analysis.analysis_id) {
    RejectReference(EntityType::kAnalysis, analysis.analysis_id, "analysis cannot be its own parent");
  }

  std::optional<std::string> game_id;
  for (const auto& snapshot_id : analysis.input_snapshot_ids) {
    auto snapshot = repository_->GetSnapshot(*tx, snapshot_id);
    if (!snapshot) {
      RejectReference(EntityType::kAnalysis, analysis.analysis_id, "input snapshot " + snapshot_id + " does not exist");
    }
    if (game_id && *game_id != snapshot->game_id) {
      RejectReference(EntityType::kAnalysis, analysis.analysis_id, "input snapshots span games " + *game_id + " and " + snapshot->game_id);
    }
    game_id = snapshot->game_id;
  }

  if (analysis.parent_analysis_id) {
    auto parent = repository_->GetAnalysis(*tx, *analysis.parent_analysis_id);
    if (!parent) {
      RejectReference(EntityType::kAnalysis, analysis.analysis_id, "parent analysis " + *analysis.parent_analysis_id + " does not exist");
    }
    if (parent->created_at > analysis.created_at) {
      RejectReference(EntityType::kAnalysis, analysis.analysis_id, "parent analysis " + parent->analysis_id + " was created after its child");
    }
  }

  ThrowIfDbError(repository_->InsertAnalysis(*tx, analysis), EntityType::kAnalysis, analysis.analysis_id, "insert analysis");
  tx->Commit();

  LogStored(EntityType::kAnalysis, analysis.analysis_id, hash);
  return analysis;
}

model::Analysis ImmutableStore::GetAnalysis(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAnalysis(*tx, id);
  if (!record) throw util::NotFoundError("analysis", id);
  return Verified(*record, EntityType::kAnalysis, id);
}

std::vector<model::Analysis> ImmutableStore::ListAnalyses() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListAnalyses(*tx);
  for (const auto& record : records) {
    Verified(record, EntityType::kAnalysis, record.analysis_id);
  }
  return records;
}

std::vector<model::Analysis> ImmutableStore::ListChildren(const std::string& analysis_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListChildAnalyses(*tx, analysis_id);
  for (const auto& record : records) {
    Verified(record, EntityType::kAnalysis, record.analysis_id);
  }
  return records;
}

std::vector<model::Analysis> ImmutableStore::ListLineagePath(const std::string& analysis_id) {
  auto tx = repository_->Begin();

  std::unordered_map<std::string, model::Analysis> loaded;
  auto path = lineage::TraceLineage(analysis_id, [&](const std::string& id) -> std::optional<lineage::LineageNode> {
    auto record = repository_->GetAnalysis(*tx, id);
    if (!record) return std::nullopt;
    Verified(*record, EntityType::kAnalysis, id);
    lineage::LineageNode node{record->analysis_id, record->parent_analysis_id, record->created_at};
    loaded.emplace(id, std::move(*record));
    return node;
  });

  std::vector<model::Analysis> out;
  out.reserve(path.size());
  for (const auto& node : path) {
    out.push_back(std::move(loaded.at(node.id)));
  }
  return out;
}

std::string ImmutableStore::GameOfAnalysis(const model::Analysis& analysis) {
  if (analysis.input_snapshot_ids.empty()) {
    throw util::IntegrityError("analysis " + analysis.analysis_id + " has no input snapshots");
  }
  return GetSnapshot(analysis.input_snapshot_ids.front()).game_id;
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

model::Outcome ImmutableStore::Insert(model::Outcome outcome) {
  RequireNonEmpty(outcome.game_id, "outcome game_id");
  RequireNonEmpty(outcome.source, "outcome source");
  if (outcome.final_score.home < 0 || outcome.final_score.away < 0) {
    throw std::invalid_argument("final score must not be negative");
  }
  if (outcome.winner) {
    RequireNonEmpty(*outcome.winner, "outcome winner");
  }
  if (outcome.revision < 1) {
    throw std::invalid_argument("outcome revision must be at least 1");
  }
  if ((outcome.revision == 1) != !outcome.supersedes_outcome_id.has_value()) {
    throw std::invalid_argument("a corrected outcome must name the revision it supersedes, a first report must not");
  }
  outcome.occurred_at = StampOrNow(outcome.occurred_at);

  const auto hash = AssignHash(outcome, EntityType::kOutcome, outcome.outcome_id);
  auto       lock = LockKey("outcome:" + outcome.game_id);
  auto       tx   = repository_->Begin();

  if (auto existing = repository_->FindOutcomeByHash(*tx, hash)) {
    LogDeduplicated(EntityType::kOutcome, existing->outcome_id, hash);
    return Verified(*existing, EntityType::kOutcome, existing->outcome_id);
  }

  if (outcome.outcome_id.empty()) outcome.outcome_id = util::NewId();

  const auto revisions = repository_->ListOutcomesByGame(*tx, outcome.game_id);
  if (outcome.supersedes_outcome_id) {
    auto superseded = repository_->GetOutcome(*tx, *outcome.supersedes_outcome_id);
    if (!superseded) {
      RejectReference(EntityType::kOutcome, outcome.outcome_id, "superseded outcome " + *outcome.supersedes_outcome_id + " does not exist");
    }
    if (superseded->game_id != outcome.game_id) {
      RejectReference(EntityType::kOutcome, outcome.outcome_id, "superseded outcome belongs to game " + superseded->game_id);
    }
    const auto& latest = revisions.back();
    if (latest.outcome_id != superseded->outcome_id || outcome.revision != latest.revision + 1) {
      SPORTSLEDGER_LOG_WARN("Rejected outcome correction",
                            {StringField("game_id", outcome.game_id), StringField("current", latest.outcome_id)});
      throw util::UniquenessError("outcome", outcome.game_id + " revision " + std::to_string(outcome.revision));
    }
  } else if (!revisions.empty()) {
    SPORTSLEDGER_LOG_WARN("Rejected duplicate outcome", {StringField("game_id", outcome.game_id)});
    throw util::UniquenessError("outcome", outcome.game_id);
  }

  ThrowIfDbError(repository_->InsertOutcome(*tx, outcome), EntityType::kOutcome, outcome.game_id, "insert outcome");
  tx->Commit();

  LogStored(EntityType::kOutcome, outcome.outcome_id, hash);
  return outcome;
}

model::Outcome ImmutableStore::GetOutcome(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetOutcome(*tx, id);
  if (!record) throw util::NotFoundError("outcome", id);
  return Verified(*record, EntityType::kOutcome, id);
}

std::optional<model::Outcome> ImmutableStore::CurrentOutcome(const std::string& game_id) {
  auto revisions = ListOutcomes(game_id);
  if (revisions.empty()) return std::nullopt;
  return std::move(revisions.back());
}

std::vector<model::Outcome> ImmutableStore::ListOutcomes() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOutcomes(*tx);
  for (const auto& record : records) {
    Verified(record, EntityType::kOutcome, record.outcome_id);
  }
  return records;
}

std::vector<model::Outcome> ImmutableStore::ListOutcomes(const std::string& game_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOutcomesByGame(*tx, game_id);
  for (const auto& record : records) {
    Verified(record, EntityType::kOutcome, record.outcome_id);
  }
  return records;
}

// ------------------------------------------------------------------
// Evaluations
// ------------------------------------------------------------------

model::Evaluation ImmutableStore::Insert(model::Evaluation evaluation) {
  RequireNonEmpty(evaluation.analysis_id, "evaluation analysis_id");
  RequireNonEmpty(evaluation.outcome_id, "evaluation outcome_id");
  RequireNonEmpty(evaluation.game_id, "evaluation game_id");
  RequireProbabilityMetric(evaluation.metrics.brier_score, "brier_score", 1.0);
  RequireProbabilityMetric(evaluation.metrics.log_loss, "log_loss", INFINITY);
  if (evaluation.metrics.roi && !std::isfinite(*evaluation.metrics.roi)) {
    throw std::invalid_argument("roi must be finite");
  }
  evaluation.scored_at = StampOrNow(evaluation.scored_at);

  const auto hash = AssignHash(evaluation, EntityType::kEvaluation, evaluation.evaluation_id);
  auto       lock = LockKey("evaluation:" + hash);
  auto       tx   = repository_->Begin();

  if (auto existing = repository_->FindEvaluationByHash(*tx, hash)) {
    LogDeduplicated(EntityType::kEvaluation, existing->evaluation_id, hash);
    return Verified(*existing, EntityType::kEvaluation, existing->evaluation_id);
  }

  if (evaluation.evaluation_id.empty()) evaluation.evaluation_id = util::NewId();

  auto analysis = repository_->GetAnalysis(*tx, evaluation.analysis_id);
  if (!analysis) {
    RejectReference(EntityType::kEvaluation, evaluation.evaluation_id, "analysis " + evaluation.analysis_id + " does not exist");
  }
  auto outcome = repository_->GetOutcome(*tx, evaluation.outcome_id);
  if (!outcome) {
    RejectReference(EntityType::kEvaluation, evaluation.evaluation_id, "outcome " + evaluation.outcome_id + " does not exist");
  }
  auto first_input = repository_->GetSnapshot(*tx, analysis->input_snapshot_ids.front());
  if (!first_input) {
    throw util::IntegrityError("analysis " + analysis->analysis_id + " references a missing snapshot");
  }
  if (first_input->game_id != outcome->game_id || evaluation.game_id != outcome->game_id) {
    RejectReference(EntityType::kEvaluation, evaluation.evaluation_id,
                    "analysis game " + first_input->game_id + " does not match outcome game " + outcome->game_id);
  }

  ThrowIfDbError(repository_->InsertEvaluation(*tx, evaluation), EntityType::kEvaluation, evaluation.evaluation_id, "insert evaluation");
  tx->Commit();

  LogStored(EntityType::kEvaluation, evaluation.evaluation_id, hash);
  return evaluation;
}

model::Evaluation ImmutableStore::GetEvaluation(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEvaluation(*tx, id);
  if (!record) throw util::NotFoundError("evaluation", id);
  return Verified(*record, EntityType::kEvaluation, id);
}

std::vector<model::Evaluation> ImmutableStore::ListEvaluations() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListEvaluations(*tx);
  for (const auto& record : records) {
    Verified(record, EntityType::kEvaluation, record.evaluation_id);
  }
  return records;
}

std::vector<model::Evaluation> ImmutableStore::ListEvaluations(const std::string& analysis_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListEvaluationsByAnalysis(*tx, analysis_id);
  for (const auto& record : records) {
    Verified(record, EntityType::kEvaluation, record.evaluation_id);
  }
  return records;
}

// ------------------------------------------------------------------
// Proposals
// ------------------------------------------------------------------

model::ImprovementProposal ImmutableStore::Insert(model::ImprovementProposal proposal) {
  if (proposal.based_on_evaluation_ids.empty()) {
    throw std::invalid_argument("proposal requires at least one evaluation");
  }
  RequireUnique(proposal.based_on_evaluation_ids, "based_on_evaluation_ids");
  RequireNonEmpty(proposal.proposal_text, "proposal_text");
  if (proposal.status != model::ProposalStatus::kPending) {
    throw std::invalid_argument("proposals are created pending");
  }
  proposal.created_at = StampOrNow(proposal.created_at);

  const auto hash = AssignHash(proposal, EntityType::kProposal, proposal.proposal_id);
  auto       lock = LockKey("proposal:" + hash);
  auto       tx   = repository_->Begin();

  // the stored copy may have moved on from pending; same content under any
  // status is the same proposal
  for (const auto status : model::kProposalStatuses) {
    auto candidate   = proposal;
    candidate.status = status;
    if (auto existing = repository_->FindProposalByHash(*tx, model::ComputeHash(candidate))) {
      LogDeduplicated(EntityType::kProposal, existing->proposal_id, existing->hash);
      return Verified(*existing, EntityType::kProposal, existing->proposal_id);
    }
  }

  if (proposal.proposal_id.empty()) proposal.proposal_id = util::NewId();

  for (const auto& evaluation_id : proposal.based_on_evaluation_ids) {
    if (!repository_->GetEvaluation(*tx, evaluation_id)) {
      RejectReference(EntityType::kProposal, proposal.proposal_id, "evaluation " + evaluation_id + " does not exist");
    }
  }

  ThrowIfDbError(repository_->InsertProposal(*tx, proposal), EntityType::kProposal, proposal.proposal_id, "insert proposal");
  tx->Commit();

  LogStored(EntityType::kProposal, proposal.proposal_id, hash);
  return proposal;
}

model::ImprovementProposal ImmutableStore::GetProposal(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetProposal(*tx, id);
  if (!record) throw util::NotFoundError("proposal", id);
  return Verified(*record, EntityType::kProposal, id);
}

std::vector<model::ImprovementProposal> ImmutableStore::ListProposals() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListProposals(*tx);
  for (const auto& record : records) {
    Verified(record, EntityType::kProposal, record.proposal_id);
  }
  return records;
}

model::ImprovementProposal ImmutableStore::UpdateProposalStatus(const std::string& proposal_id, model::ProposalStatus status) {
  auto lock = LockKey("proposal-id:" + proposal_id);
  auto tx   = repository_->Begin();

  auto record = repository_->GetProposal(*tx, proposal_id);
  if (!record) throw util::NotFoundError("proposal", proposal_id);
  Verified(*record, EntityType::kProposal, proposal_id);

  if (!model::CanTransition(record->status, status)) {
    SPORTSLEDGER_LOG_WARN("Rejected proposal transition", {StringField("proposal_id", proposal_id),
                                                           StringField("from", model::ToString(record->status)),
                                                           StringField("to", model::ToString(status))});
    throw util::InvalidTransitionError(std::string(model::ToString(record->status)), std::string(model::ToString(status)));
  }

  const auto from = record->status;
  record->status  = status;
  record->hash    = model::ComputeHash(*record);

  ThrowIfDbError(repository_->UpdateProposalStatus(*tx, proposal_id, status, record->hash), EntityType::kProposal, proposal_id,
                 "update proposal status");
  tx->Commit();

  SPORTSLEDGER_LOG_INFO("Proposal status changed", {StringField("proposal_id", proposal_id), StringField("from", model::ToString(from)),
                                                    StringField("to", model::ToString(status))});
  return *record;
}

// ------------------------------------------------------------------
// Mutation requests
// ------------------------------------------------------------------

void ImmutableStore::Update(model::EntityType entity, const std::string& id, const std::string& field) {
  SPORTSLEDGER_LOG_WARN("Rejected update", {StringField("entity", Name(entity)), StringField("id", id), StringField("field", field)});
  throw util::ImmutabilityViolationError("update " + field, Name(entity));
}

void ImmutableStore::Remove(model::EntityType entity, const std::string& id) {
  SPORTSLEDGER_LOG_WARN("Rejected delete", {StringField("entity", Name(entity)), StringField("id", id)});
  throw util::ImmutabilityViolationError("delete", Name(entity));
}

} // namespace sportsledger::store
