#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/comparison/odds.hpp"
#include "internal/model/records.hpp"

namespace sportsledger::scoring {

struct ScoringOptions {
  double log_loss_epsilon = 1e-9;
};

// (p - actual)^2, actual in {0, 1}.
double BrierScore(double p, int actual);

// -[actual ln p + (1 - actual) ln(1 - p)] with p clamped to [eps, 1 - eps].
double LogLoss(double p, int actual, double epsilon);

// (payout - stake) / stake.
double Roi(double stake, double payout);

// A binary contract bought at price returns stake / price when it wins.
double PredictionMarketPayout(double stake, double price, bool won);

/*
  Did the flagged direction match the result?

  sportsbook_higher means the market underprices home, so the edge bets on
  home; market_higher bets against. Unflagged edges carry no signal.
*/
model::EdgeRealized ScoreEdge(const comparison::Edge& edge, bool home_won);

/*
  Scores an analysis produced by the comparison engine against the
  outcome of its game. Uses the latest comparison and the recommended
  action, if any (roi is absent without one). The returned Evaluation is
  unsaved: evaluation_id, scored_at and hash are left for the store.

  Throws std::invalid_argument if the analysis carries no comparison or
  the outcome is for a different game.
*/
model::Evaluation ScoreAnalysis(const model::Analysis& analysis, const model::Outcome& outcome, const ScoringOptions& options);

struct AggregateReport {
  std::size_t           total_evaluations = 0;
  std::optional<double> avg_brier_score;
  std::optional<double> avg_log_loss;
  std::optional<double> avg_roi;
  std::optional<double> total_roi;
  std::size_t           edge_wins      = 0;
  std::size_t           edge_losses    = 0;
  std::size_t           edge_no_signal = 0;
  std::optional<double> edge_win_rate;
  std::string           interpretation;

  google::protobuf::Struct ToStruct() const;
};

AggregateReport Aggregate(const std::vector<model::Evaluation>& evaluations);

} // namespace sportsledger::scoring
