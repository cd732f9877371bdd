#include "internal/comparison/comparison_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "internal/comparison/odds.hpp"
#include "internal/model/normalized_fields.hpp"
#include "internal/util/json.hpp"

namespace sportsledger::comparison {
namespace {

namespace fields = model::fields;

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr char kAnalysisType[] = "prediction_market_vs_sportsbook_no_vig";

struct MarketQuote {
  std::string           market_id;
  std::string           title;
  std::optional<double> yes_bid;
  std::optional<double> yes_ask;
  std::optional<double> volume;
};

struct SnapshotComparison {
  const model::Snapshot* snapshot = nullptr;

  std::string home_team;
  std::string away_team;
  double      home_odds = 0;
  double      away_odds = 0;
  double      implied_home = 0;
  double      implied_away = 0;
  NoVigPair   fair;

  std::optional<MarketQuote> market;
  std::optional<double>      mid;
  std::optional<Edge>        edge;
};

std::optional<SnapshotComparison> Compare(const model::Snapshot& snapshot, double threshold) {
  const auto* book = util::GetStruct(snapshot.normalized_fields, fields::kSportsbook);
  if (!book) return std::nullopt;

  auto home_odds = util::GetNumber(*book, fields::kBestHomeOdds);
  auto away_odds = util::GetNumber(*book, fields::kBestAwayOdds);
  if (!home_odds || !away_odds) return std::nullopt;

  SnapshotComparison c;
  c.snapshot     = &snapshot;
  c.home_team    = util::GetString(*book, fields::kHomeTeam).value_or("");
  c.away_team    = util::GetString(*book, fields::kAwayTeam).value_or("");
  c.home_odds    = *home_odds;
  c.away_odds    = *away_odds;
  c.implied_home = AmericanToProbability(c.home_odds);
  c.implied_away = AmericanToProbability(c.away_odds);
  c.fair         = RemoveVig(c.implied_home, c.implied_away);

  if (const auto* market = util::GetStruct(snapshot.normalized_fields, fields::kPredictionMarket)) {
    MarketQuote quote;
    quote.market_id = util::GetString(*market, fields::kMarketId).value_or("");
    quote.title     = util::GetString(*market, fields::kTitle).value_or("");
    quote.yes_bid   = util::GetNumber(*market, fields::kYesBid);
    quote.yes_ask   = util::GetNumber(*market, fields::kYesAsk);
    quote.volume    = util::GetNumber(*market, fields::kVolume);

    if (quote.yes_bid || quote.yes_ask) {
      c.mid  = MidPrice(quote.yes_bid, quote.yes_ask);
      c.edge = ComputeEdge(*c.mid, c.fair.fair_a, threshold);
    }
    c.market = std::move(quote);
  }
  return c;
}

std::string Percent(double value) {
  std::ostringstream out;
  out << std::showpos << std::fixed << std::setprecision(2) << value * 100.0 << "%";
  return out.str();
}

std::string Probability(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

Struct ToStruct(const SnapshotComparison& c) {
  Struct out;
  auto&  f = *out.mutable_fields();

  f["snapshot_id"]              = util::StringValue(c.snapshot->snapshot_id);
  f["collected_at"]             = util::StringValue(util::FormatTimestamp(c.snapshot->collected_at));
  f["home_team"]                = util::StringValue(c.home_team);
  f["away_team"]                = util::StringValue(c.away_team);
  f["sportsbook_home_odds"]     = util::NumberValue(c.home_odds);
  f["sportsbook_away_odds"]     = util::NumberValue(c.away_odds);
  f["implied_home_probability"] = util::NumberValue(c.implied_home);
  f["implied_away_probability"] = util::NumberValue(c.implied_away);
  f["overround"]                = util::NumberValue(c.fair.overround);
  f["fair_home_probability"]    = util::NumberValue(c.fair.fair_a);
  f["fair_away_probability"]    = util::NumberValue(c.fair.fair_b);
  f["matched"]                  = util::BoolValue(c.market.has_value());

  if (!c.market) {
    f["match_note"] = util::StringValue("no prediction market matched");
    return out;
  }

  f["market_id"]    = util::StringValue(c.market->market_id);
  f["market_title"] = util::StringValue(c.market->title);
  f["yes_bid"]      = c.market->yes_bid ? util::NumberValue(*c.market->yes_bid) : util::NullValue();
  f["yes_ask"]      = c.market->yes_ask ? util::NumberValue(*c.market->yes_ask) : util::NullValue();
  f["volume"]       = c.market->volume ? util::NumberValue(*c.market->volume) : util::NullValue();

  if (!c.edge) {
    f["match_note"] = util::StringValue("prediction market has no quote");
    return out;
  }

  f["market_mid"]     = util::NumberValue(*c.mid);
  f["delta_home"]     = util::NumberValue(c.edge->delta);
  f["edge_magnitude"] = util::NumberValue(c.edge->magnitude);
  f["edge_flagged"]   = util::BoolValue(c.edge->flagged);
  f["edge_direction"] = util::StringValue(std::string(ToString(c.edge->direction)));
  return out;
}

std::string Summary(const SnapshotComparison& latest, double threshold) {
  std::ostringstream out;
  out << latest.away_team << " @ " << latest.home_team << ": ";
  if (!latest.market) {
    out << "no prediction market matched; fair home probability " << Probability(latest.fair.fair_a) << ".";
    return out.str();
  }
  if (!latest.edge) {
    out << "prediction market " << latest.market->market_id << " has no quote.";
    return out.str();
  }

  out << "market " << Probability(*latest.mid) << " vs fair " << Probability(latest.fair.fair_a) << " ("
      << Percent(latest.edge->delta) << "). ";
  if (!latest.edge->flagged) {
    out << "No edge above " << Percent(threshold).substr(1) << ".";
  } else if (latest.edge->direction == EdgeDirection::kSportsbookHigher) {
    out << "Edge candidate: market underprices " << latest.home_team << ".";
  } else {
    out << "Edge candidate: market overprices " << latest.home_team << ".";
  }
  return out.str();
}

// YES pays when home wins. Buying YES lifts the ask; buying NO is selling
// YES at the bid.
std::optional<Struct> Recommendation(const SnapshotComparison& latest, const std::string& game_id, double stake) {
  if (!latest.edge || !latest.edge->flagged) return std::nullopt;

  const bool   buy_yes = latest.edge->delta < 0;
  const double entry   = buy_yes ? latest.market->yes_ask.value_or(*latest.mid * 100.0) / 100.0
                                 : 1.0 - latest.market->yes_bid.value_or(*latest.mid * 100.0) / 100.0;
  if (entry <= 0.0 || entry >= 1.0) return std::nullopt;

  Struct action;
  auto&  f = *action.mutable_fields();
  f["type"]        = util::StringValue("edge_candidate");
  f["game_id"]     = util::StringValue(game_id);
  f["venue"]       = util::StringValue("prediction_market");
  f["market_id"]   = util::StringValue(latest.market->market_id);
  f["side"]        = util::StringValue(buy_yes ? "yes" : "no");
  f["team"]        = util::StringValue(buy_yes ? latest.home_team : latest.away_team);
  f["entry_price"] = util::NumberValue(entry);
  f["stake"]       = util::NumberValue(stake);
  f["edge"]        = util::NumberValue(latest.edge->magnitude);
  f["fair_probability"] = util::NumberValue(buy_yes ? latest.fair.fair_a : latest.fair.fair_b);
  return action;
}

} // namespace

std::optional<model::Analysis> Analyze(const std::vector<model::Snapshot>& snapshots,
                                       const ComparisonOptions&            options,
                                       const std::optional<std::string>&   parent_analysis_id) {
  if (snapshots.empty()) {
    throw std::invalid_argument("analysis needs at least one snapshot");
  }
  if (!std::isfinite(options.edge_threshold) || options.edge_threshold < 0.0) {
    throw std::invalid_argument("edge threshold must be non-negative");
  }
  if (!std::isfinite(options.stake_units) || options.stake_units <= 0.0) {
    throw std::invalid_argument("stake must be positive");
  }

  const auto& game_id = snapshots.front().game_id;
  std::vector<const model::Snapshot*> ordered;
  ordered.reserve(snapshots.size());
  for (const auto& snapshot : snapshots) {
    if (snapshot.game_id != game_id) {
      throw std::invalid_argument("snapshots " + snapshots.front().snapshot_id + " and " + snapshot.snapshot_id +
                                  " belong to different games");
    }
    ordered.push_back(&snapshot);
  }
  std::sort(ordered.begin(), ordered.end(), [](const model::Snapshot* a, const model::Snapshot* b) {
    if (a->collected_at != b->collected_at) return a->collected_at < b->collected_at;
    return a->snapshot_id < b->snapshot_id;
  });

  std::vector<SnapshotComparison> comparisons;
  for (const auto* snapshot : ordered) {
    if (auto c = Compare(*snapshot, options.edge_threshold)) {
      comparisons.push_back(std::move(*c));
    }
  }
  if (comparisons.empty()) {
    return std::nullopt;
  }

  const auto& latest = comparisons.back();

  model::Analysis analysis;
  analysis.analysis_version   = options.analysis_version;
  analysis.code_version       = options.code_version;
  analysis.model_version      = options.model_version;
  analysis.parent_analysis_id = parent_analysis_id;
  for (const auto* snapshot : ordered) {
    analysis.input_snapshot_ids.push_back(snapshot->snapshot_id);
  }

  auto& features = *analysis.derived_features.mutable_fields();
  features["analysis_type"]  = util::StringValue(kAnalysisType);
  features["game_id"]        = util::StringValue(game_id);
  features["edge_threshold"] = util::NumberValue(options.edge_threshold);
  features["snapshot_count"] = util::NumberValue(static_cast<double>(ordered.size()));
  features["predicted_home_probability"] = util::NumberValue(latest.fair.fair_a);

  Value list;
  for (const auto& c : comparisons) {
    *list.mutable_list_value()->add_values()->mutable_struct_value() = ToStruct(c);
  }
  features["comparisons"] = std::move(list);

  double overround_sum = 0.0;
  std::vector<double> deltas;
  for (const auto& c : comparisons) {
    overround_sum += c.fair.overround;
    if (c.edge) deltas.push_back(c.edge->delta);
  }

  auto& conclusions = *analysis.conclusions.mutable_fields();
  conclusions["matched"]        = util::BoolValue(latest.market.has_value());
  conclusions["edge_flagged"]   = util::BoolValue(latest.edge && latest.edge->flagged);
  conclusions["edge_direction"] = util::StringValue(std::string(ToString(latest.edge ? latest.edge->direction : EdgeDirection::kNone)));
  conclusions["delta_home"]     = latest.edge ? util::NumberValue(latest.edge->delta) : util::NullValue();
  conclusions["avg_overround"]  = util::NumberValue(overround_sum / static_cast<double>(comparisons.size()));
  conclusions["delta_trend"]    = deltas.size() >= 2 ? util::NumberValue(deltas.back() - deltas.front()) : util::NullValue();
  conclusions["summary"]        = util::StringValue(Summary(latest, options.edge_threshold));

  if (auto action = Recommendation(latest, game_id, options.stake_units)) {
    *analysis.recommended_actions.add_values()->mutable_struct_value() = std::move(*action);
  }
  return analysis;
}

} // namespace sportsledger::comparison
