#include "internal/scoring/scoring_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "internal/util/json.hpp"

namespace sportsledger::scoring {
namespace {

void RequireProbability(double p) {
  if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
    throw std::invalid_argument("predicted probability must be in [0, 1]");
  }
}

void RequireBinary(int actual) {
  if (actual != 0 && actual != 1) {
    throw std::invalid_argument("actual outcome must be 0 or 1");
  }
}

std::optional<double> Mean(const std::vector<double>& values) {
  if (values.empty()) return std::nullopt;
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

google::protobuf::Value OptionalNumber(const std::optional<double>& value) {
  return value ? util::NumberValue(*value) : util::NullValue();
}

std::string Interpret(const AggregateReport& report) {
  std::vector<std::string> parts;

  if (report.avg_brier_score) {
    std::ostringstream out;
    out << "Brier " << std::fixed << std::setprecision(3) << *report.avg_brier_score;
    if (*report.avg_brier_score < 0.2) {
      out << " (good calibration)";
    } else if (*report.avg_brier_score < 0.25) {
      out << " (fair calibration)";
    } else {
      out << " (needs improvement)";
    }
    parts.push_back(out.str());
  }

  if (report.avg_roi) {
    std::ostringstream out;
    out << "ROI " << std::showpos << std::fixed << std::setprecision(1) << *report.avg_roi * 100.0 << "%"
        << (*report.avg_roi > 0 ? " (profitable)" : " (losing)");
    parts.push_back(out.str());
  }

  if (report.edge_win_rate) {
    std::ostringstream out;
    out << "Edge bets " << std::fixed << std::setprecision(0) << *report.edge_win_rate * 100.0 << "% win rate";
    if (*report.edge_win_rate > 0.55) {
      out << " (edge working)";
    } else if (*report.edge_win_rate > 0.45) {
      out << " (inconclusive)";
    } else {
      out << " (edge not working)";
    }
    parts.push_back(out.str());
  }

  if (parts.empty()) return "Insufficient data";

  std::string joined;
  for (const auto& part : parts) {
    if (!joined.empty()) joined += " | ";
    joined += part;
  }
  return joined;
}

} // namespace

double BrierScore(double p, int actual) {
  RequireProbability(p);
  RequireBinary(actual);
  const double diff = p - actual;
  return diff * diff;
}

double LogLoss(double p, int actual, double epsilon) {
  RequireProbability(p);
  RequireBinary(actual);
  if (!(epsilon > 0.0 && epsilon < 0.5)) {
    throw std::invalid_argument("log loss epsilon must be in (0, 0.5)");
  }
  const double clamped = std::clamp(p, epsilon, 1.0 - epsilon);
  return -(actual * std::log(clamped) + (1 - actual) * std::log(1.0 - clamped));
}

double Roi(double stake, double payout) {
  if (!std::isfinite(stake) || stake <= 0.0) {
    throw std::invalid_argument("stake must be positive");
  }
  if (!std::isfinite(payout) || payout < 0.0) {
    throw std::invalid_argument("payout must be non-negative");
  }
  return (payout - stake) / stake;
}

double PredictionMarketPayout(double stake, double price, bool won) {
  if (!std::isfinite(price) || price <= 0.0 || price >= 1.0) {
    throw std::invalid_argument("contract price must be in (0, 1)");
  }
  if (!std::isfinite(stake) || stake <= 0.0) {
    throw std::invalid_argument("stake must be positive");
  }
  return won ? stake / price : 0.0;
}

model::EdgeRealized ScoreEdge(const comparison::Edge& edge, bool home_won) {
  if (!edge.flagged || edge.direction == comparison::EdgeDirection::kNone) {
    return model::EdgeRealized::kNoSignal;
  }
  const bool bet_home = edge.direction == comparison::EdgeDirection::kSportsbookHigher;
  return bet_home == home_won ? model::EdgeRealized::kRealized : model::EdgeRealized::kMissed;
}

model::Evaluation ScoreAnalysis(const model::Analysis& analysis, const model::Outcome& outcome, const ScoringOptions& options) {
  const auto* comparisons = util::GetList(analysis.derived_features, "comparisons");
  if (!comparisons || comparisons->values_size() == 0) {
    throw std::invalid_argument("analysis " + analysis.analysis_id + " carries no comparison to score");
  }
  const auto& last = comparisons->values(comparisons->values_size() - 1);
  if (last.kind_case() != google::protobuf::Value::kStructValue) {
    throw std::invalid_argument("analysis " + analysis.analysis_id + " has a malformed comparison");
  }
  const auto& latest = last.struct_value();

  const auto game_id = util::GetString(analysis.derived_features, "game_id");
  if (game_id && *game_id != outcome.game_id) {
    throw std::invalid_argument("analysis " + analysis.analysis_id + " is about game " + *game_id + ", outcome is for " +
                                outcome.game_id);
  }

  const auto predicted = util::GetNumber(latest, "fair_home_probability");
  if (!predicted) {
    throw std::invalid_argument("analysis " + analysis.analysis_id + " has no predicted probability");
  }

  const auto home_team = util::GetString(latest, "home_team").value_or("");
  const auto away_team = util::GetString(latest, "away_team").value_or("");
  // a tie counts as home not winning
  const bool home_won = outcome.winner && !home_team.empty() && *outcome.winner == home_team;
  const int  actual   = home_won ? 1 : 0;

  model::Evaluation evaluation;
  evaluation.analysis_id = analysis.analysis_id;
  evaluation.outcome_id  = outcome.outcome_id;
  evaluation.game_id     = outcome.game_id;

  auto& metrics       = evaluation.metrics;
  metrics.brier_score = BrierScore(*predicted, actual);
  metrics.log_loss    = LogLoss(*predicted, actual, options.log_loss_epsilon);

  if (analysis.recommended_actions.values_size() > 0 &&
      analysis.recommended_actions.values(0).kind_case() == google::protobuf::Value::kStructValue) {
    const auto& action = analysis.recommended_actions.values(0).struct_value();
    const auto  side   = util::GetString(action, "side");
    const auto  price  = util::GetNumber(action, "entry_price");
    const auto  stake  = util::GetNumber(action, "stake");
    if (side && price && stake) {
      const bool won = (*side == "yes") == home_won;
      metrics.roi    = Roi(*stake, PredictionMarketPayout(*stake, *price, won));
    }
  }

  comparison::Edge edge;
  edge.flagged = util::GetBool(latest, "edge_flagged").value_or(false);
  if (auto direction = util::GetString(latest, "edge_direction")) {
    edge.direction = comparison::ParseEdgeDirection(*direction);
  }
  metrics.edge_realized = ScoreEdge(edge, home_won);

  auto& notes = *evaluation.notes.mutable_fields();
  notes["home_team"]   = util::StringValue(home_team);
  notes["away_team"]   = util::StringValue(away_team);
  notes["winner"]      = outcome.winner ? util::StringValue(*outcome.winner) : util::NullValue();
  notes["home_won"]    = util::BoolValue(home_won);
  notes["final_score"] = util::StringValue(std::to_string(outcome.final_score.away) + "-" + std::to_string(outcome.final_score.home));
  notes["predicted_home_probability"] = util::NumberValue(*predicted);
  notes["market_mid"]       = OptionalNumber(util::GetNumber(latest, "market_mid"));
  notes["delta_home"]       = OptionalNumber(util::GetNumber(latest, "delta_home"));
  notes["edge_direction"]   = util::StringValue(std::string(comparison::ToString(edge.direction)));
  notes["outcome_revision"] = util::NumberValue(static_cast<double>(outcome.revision));
  return evaluation;
}

google::protobuf::Struct AggregateReport::ToStruct() const {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["total_evaluations"] = util::NumberValue(static_cast<double>(total_evaluations));
  f["avg_brier_score"]   = OptionalNumber(avg_brier_score);
  f["avg_log_loss"]      = OptionalNumber(avg_log_loss);
  f["avg_roi"]           = OptionalNumber(avg_roi);
  f["total_roi"]         = OptionalNumber(total_roi);
  f["edge_bets_won"]     = util::NumberValue(static_cast<double>(edge_wins));
  f["edge_bets_lost"]    = util::NumberValue(static_cast<double>(edge_losses));
  f["edge_no_signal"]    = util::NumberValue(static_cast<double>(edge_no_signal));
  f["edge_win_rate"]     = OptionalNumber(edge_win_rate);
  f["interpretation"]    = util::StringValue(interpretation);
  return out;
}

AggregateReport Aggregate(const std::vector<model::Evaluation>& evaluations) {
  AggregateReport report;
  report.total_evaluations = evaluations.size();

  std::vector<double> brier;
  std::vector<double> log_loss;
  std::vector<double> roi;
  for (const auto& evaluation : evaluations) {
    const auto& m = evaluation.metrics;
    if (m.brier_score) brier.push_back(*m.brier_score);
    if (m.log_loss) log_loss.push_back(*m.log_loss);
    if (m.roi) roi.push_back(*m.roi);

    switch (m.edge_realized) {
      case model::EdgeRealized::kRealized:
        ++report.edge_wins;
        break;
      case model::EdgeRealized::kMissed:
        ++report.edge_losses;
        break;
      case model::EdgeRealized::kNoSignal:
        ++report.edge_no_signal;
        break;
    }
  }

  report.avg_brier_score = Mean(brier);
  report.avg_log_loss    = Mean(log_loss);
  report.avg_roi         = Mean(roi);
  if (!roi.empty()) {
    double sum = 0.0;
    for (double v : roi) sum += v;
    report.total_roi = sum;
  }

  const auto decided = report.edge_wins + report.edge_losses;
  if (decided > 0) {
    report.edge_win_rate = static_cast<double>(report.edge_wins) / static_cast<double>(decided);
  }
  report.interpretation = Interpret(report);
  return report;
}

} // namespace sportsledger::scoring
