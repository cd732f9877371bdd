#include "evaluation_service.hpp"

#include <map>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/store/immutable_store.hpp"
#include "internal/util/errors.hpp"

namespace sportsledger::service {

using observability::StringField;

EvaluationService::EvaluationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::Evaluation EvaluationService::Evaluate(const std::string& analysis_id) {
  const auto analysis = ctx_.store->GetAnalysis(analysis_id);
  const auto game_id  = ctx_.store->GameOfAnalysis(analysis);

  auto outcome = ctx_.store->CurrentOutcome(game_id);
  if (!outcome) {
    throw util::NotFoundError("outcome", game_id);
  }

  auto stored = ctx_.store->Insert(scoring::ScoreAnalysis(analysis, *outcome, ctx_.scoring));
  SPORTSLEDGER_LOG_INFO("Evaluation stored", {StringField("analysis_id", analysis_id), StringField("evaluation_id", stored.evaluation_id),
                                              StringField("edge_realized", model::ToString(stored.metrics.edge_realized))});
  return stored;
}

std::vector<std::string> EvaluationService::AnalysisIds() {
  auto&                    repository = ctx_.store->repository();
  auto                     tx         = repository.Begin();
  std::vector<std::string> ids;
  for (auto& key : repository.ListRecordKeys(*tx, model::EntityType::kAnalysis)) {
    ids.push_back(std::move(key.id));
  }
  tx->Rollback();
  return ids;
}

std::optional<model::Outcome> EvaluationService::UnscoredOutcome(const model::Analysis& analysis) {
  auto outcome = ctx_.store->CurrentOutcome(ctx_.store->GameOfAnalysis(analysis));
  if (!outcome) {
    return std::nullopt;
  }
  for (const auto& evaluation : ctx_.store->ListEvaluations(analysis.analysis_id)) {
    if (evaluation.outcome_id == outcome->outcome_id) {
      return std::nullopt;
    }
  }
  return outcome;
}

std::vector<std::string> EvaluationService::PendingAnalyses() {
  std::vector<std::string> pending;
  for (auto& analysis_id : AnalysisIds()) {
    if (UnscoredOutcome(ctx_.store->GetAnalysis(analysis_id))) {
      pending.push_back(std::move(analysis_id));
    }
  }
  return pending;
}

BatchReport EvaluationService::EvaluateAllPending() {
  BatchRunner runner(ctx_.batch_workers);
  return runner.Run("evaluate_all_pending", AnalysisIds(), [this](const std::string& analysis_id) {
    const auto analysis = ctx_.store->GetAnalysis(analysis_id);
    auto       outcome  = UnscoredOutcome(analysis);
    if (!outcome) {
      return UnitStatus::kSkipped;
    }
    auto stored = ctx_.store->Insert(scoring::ScoreAnalysis(analysis, *outcome, ctx_.scoring));
    SPORTSLEDGER_LOG_INFO("Evaluation stored", {StringField("analysis_id", analysis_id), StringField("evaluation_id", stored.evaluation_id),
                                                StringField("edge_realized", model::ToString(stored.metrics.edge_realized))});
    return UnitStatus::kDone;
  });
}

scoring::AggregateReport EvaluationService::Report() {
  std::map<std::string, std::string> current; // game_id -> outcome_id
  for (const auto& outcome : ctx_.store->ListOutcomes()) {
    current[outcome.game_id] = outcome.outcome_id;
  }

  std::vector<model::Evaluation> counted;
  for (auto& evaluation : ctx_.store->ListEvaluations()) {
    auto it = current.find(evaluation.game_id);
    if (it != current.end() && it->second == evaluation.outcome_id) {
      counted.push_back(std::move(evaluation));
    }
  }
  return scoring::Aggregate(counted);
}

} // namespace sportsledger::service
