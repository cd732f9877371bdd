#include "internal/comparison/comparison_engine.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/record_hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace sportsledger;
using comparison::Analyze;
using comparison::ComparisonOptions;

bool Near(double a, double b, double tolerance = 1e-6) {
  return std::fabs(a - b) < tolerance;
}

model::Snapshot MakeSnapshot(const std::string& id, const std::string& at, const std::string& market_json) {
  model::Snapshot snapshot;
  snapshot.snapshot_id  = id;
  snapshot.game_id      = "game-1";
  snapshot.collected_at = util::ParseTimestamp(at);
  std::string json      = R"({"sportsbook": {"event_id": "game-1", "home_team": "Los Angeles Lakers",
      "away_team": "Boston Celtics", "best_home_odds": -150, "best_away_odds": 130, "bookmaker_count": 3})";
  if (!market_json.empty()) {
    json.pop_back();
    json += R"(, "prediction_market": )" + market_json + "}";
  }
  snapshot.normalized_fields = util::ParseStruct(json);
  return snapshot;
}

std::string Market(int bid, int ask) {
  return R"({"market_id": "KX-LAL-BOS", "title": "Celtics at Lakers", "yes_bid": )" + std::to_string(bid) +
         R"(, "yes_ask": )" + std::to_string(ask) + "}";
}

const google::protobuf::Struct& LastComparison(const model::Analysis& analysis) {
  const auto* list = util::GetList(analysis.derived_features, "comparisons");
  assert(list && list->values_size() > 0);
  return list->values(list->values_size() - 1).struct_value();
}

void TestSmallDeltaIsNotFlagged() {
  auto analysis = Analyze({MakeSnapshot("s1", "2024-01-15T18:00:00Z", Market(55, 59))}, ComparisonOptions{});
  assert(analysis.has_value());

  const auto& latest = LastComparison(*analysis);
  assert(Near(*util::GetNumber(latest, "overround"), 1.034783));
  assert(Near(*util::GetNumber(latest, "fair_home_probability"), 0.579832));
  assert(Near(*util::GetNumber(latest, "market_mid"), 0.57));
  assert(Near(*util::GetNumber(latest, "delta_home"), -0.009832));

  assert(*util::GetBool(analysis->conclusions, "matched"));
  assert(!*util::GetBool(analysis->conclusions, "edge_flagged"));
  assert(analysis->recommended_actions.values_size() == 0);
  assert(analysis->analysis_id.empty() && analysis->hash.empty());
}

void TestSnapshotsAreOrderedAndAllBecomeInputs() {
  auto early = MakeSnapshot("s1", "2024-01-15T18:00:00Z", Market(55, 59));
  auto late  = MakeSnapshot("s2", "2024-01-15T19:00:00Z", Market(48, 52));

  auto analysis = Analyze({late, early}, ComparisonOptions{});
  assert(analysis.has_value());
  assert((analysis->input_snapshot_ids == std::vector<std::string>{"s1", "s2"}));
  assert(*util::GetNumber(analysis->derived_features, "snapshot_count") == 2.0);
  assert(*util::GetString(analysis->derived_features, "game_id") == "game-1");

  // mid 0.50 against fair 0.5798: market underprices home
  assert(*util::GetBool(analysis->conclusions, "edge_flagged"));
  assert(*util::GetString(analysis->conclusions, "edge_direction") == "sportsbook_higher");
  assert(Near(*util::GetNumber(analysis->conclusions, "delta_trend"), -0.07));

  assert(analysis->recommended_actions.values_size() == 1);
  const auto& action = analysis->recommended_actions.values(0).struct_value();
  assert(*util::GetString(action, "side") == "yes");
  assert(*util::GetString(action, "team") == "Los Angeles Lakers");
  assert(Near(*util::GetNumber(action, "entry_price"), 0.52));
  assert(*util::GetNumber(action, "stake") == 1.0);
}

void TestOverpricedHomeRecommendsNo() {
  ComparisonOptions options;
  options.stake_units = 10.0;

  auto analysis = Analyze({MakeSnapshot("s1", "2024-01-15T18:00:00Z", Market(70, 74))}, options);
  assert(analysis.has_value());
  assert(*util::GetString(analysis->conclusions, "edge_direction") == "market_higher");

  const auto& action = analysis->recommended_actions.values(0).struct_value();
  assert(*util::GetString(action, "side") == "no");
  assert(*util::GetString(action, "team") == "Boston Celtics");
  assert(Near(*util::GetNumber(action, "entry_price"), 0.30));
  assert(*util::GetNumber(action, "stake") == 10.0);
}

void TestUnmatchedMarketStillAnalyzes() {
  auto analysis = Analyze({MakeSnapshot("s1", "2024-01-15T18:00:00Z", "")}, ComparisonOptions{});
  assert(analysis.has_value());
  assert(!*util::GetBool(analysis->conclusions, "matched"));
  assert(util::GetString(LastComparison(*analysis), "match_note").has_value());
  assert(analysis->recommended_actions.values_size() == 0);
}

void TestNoSportsbookLineYieldsNothing() {
  model::Snapshot snapshot;
  snapshot.snapshot_id       = "s1";
  snapshot.game_id           = "game-1";
  snapshot.normalized_fields = util::ParseStruct(R"({"prediction_market": {"market_id": "KX", "yes_bid": 40}})");
  assert(!Analyze({snapshot}, ComparisonOptions{}).has_value());
}

void TestDeterministicAndParentIsContent() {
  const std::vector<model::Snapshot> inputs = {MakeSnapshot("s1", "2024-01-15T18:00:00Z", Market(48, 52))};

  auto first  = Analyze(inputs, ComparisonOptions{});
  auto second = Analyze(inputs, ComparisonOptions{});
  assert(model::ComputeHash(*first) == model::ComputeHash(*second));

  auto child = Analyze(inputs, ComparisonOptions{}, std::string("parent-1"));
  assert(child->parent_analysis_id == std::optional<std::string>("parent-1"));
  assert(model::ComputeHash(*first) != model::ComputeHash(*child));
}

void TestInvalidInputsAreRejected() {
  bool threw = false;
  try {
    (void)Analyze({}, ComparisonOptions{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "Empty input must be rejected.");

  auto other    = MakeSnapshot("s2", "2024-01-15T19:00:00Z", "");
  other.game_id = "game-2";
  threw         = false;
  try {
    (void)Analyze({MakeSnapshot("s1", "2024-01-15T18:00:00Z", ""), other}, ComparisonOptions{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "Snapshots of different games must be rejected.");
}

} // namespace

int main() {
  TestSmallDeltaIsNotFlagged();
  TestSnapshotsAreOrderedAndAllBecomeInputs();
  TestOverpricedHomeRecommendsNo();
  TestUnmatchedMarketStillAnalyzes();
  TestNoSportsbookLineYieldsNothing();
  TestDeterministicAndParentIsContent();
  TestInvalidInputsAreRejected();

  std::cout << "sportsledger_unit_comparison_engine: pass\n";
  return 0;
}
