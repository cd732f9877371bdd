#pragma once

#include <optional>
#include <string>
#include <vector>

#include "batch_runner.hpp"
#include "internal/model/records.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "service_context.hpp"

namespace sportsledger::service {

class EvaluationService {
 public:
  explicit EvaluationService(ServiceContext ctx);

  // Scores the analysis against the current outcome of its game. Throws
  // util::NotFoundError when the game has no outcome yet.
  model::Evaluation Evaluate(const std::string& analysis_id);

  // Analyses whose game has an outcome they have not been scored against.
  std::vector<std::string> PendingAnalyses();

  // One unit per stored analysis. Each unit reads and verifies its own
  // analysis, so a damaged record fails only its unit. Analyses with
  // nothing to score are skipped.
  BatchReport EvaluateAllPending();

  // Aggregate over evaluations scored against current outcomes only, so a
  // corrected result does not count twice.
  scoring::AggregateReport Report();

 private:
  // Stored analysis ids, read without decoding the analyses.
  std::vector<std::string> AnalysisIds();

  // Current outcome of the analysis's game, unless the analysis has
  // already been scored against it.
  std::optional<model::Outcome> UnscoredOutcome(const model::Analysis& analysis);

  ServiceContext ctx_;
};

} // namespace sportsledger::service
