#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace sportsledger;

std::string OddsEvent(const std::string& id, const std::string& home, const std::string& away, int home_price, int away_price) {
  return R"({"id": ")" + id + R"(", "home_team": ")" + home + R"(", "away_team": ")" + away +
         R"(", "commence_time": "2024-01-16T03:00:00Z", "bookmakers": [{"key": "fanduel", "markets": [{"key": "h2h",
         "outcomes": [{"name": ")" + home + R"(", "price": )" + std::to_string(home_price) + R"(}, {"name": ")" + away +
         R"(", "price": )" + std::to_string(away_price) + "}]}]}]}";
}

std::string Market(const std::string& ticker, const std::string& title, int bid, int ask) {
  return R"({"ticker": ")" + ticker + R"(", "title": ")" + title + R"(", "status": "open", "yes_bid": )" + std::to_string(bid) +
         R"(, "yes_ask": )" + std::to_string(ask) + R"(, "volume": 500})";
}

// One collector run: the whole slate from both providers, filed per game.
std::string CollectorDoc(const std::string& game_id, const std::string& at, const std::string& events, const std::string& markets) {
  return R"({"game_id": ")" + game_id + R"(", "collected_at": ")" + at + R"(", "providers": {
      "odds_api": {"version": "v4", "payload": [)" + events + R"(]},
      "kalshi": {"version": "v2", "payload": {"markets": [)" + markets + "]}}}}";
}

std::string ScoresDoc(const std::string& id, const std::string& home, const std::string& away, int home_score, int away_score) {
  return R"({"id": ")" + id + R"(", "completed": true, "home_team": ")" + home + R"(", "away_team": ")" + away +
         R"(", "commence_time": "2024-01-16T03:00:00Z", "scores": [{"name": ")" + home + R"(", "score": ")" +
         std::to_string(home_score) + R"("}, {"name": ")" + away + R"(", "score": ")" + std::to_string(away_score) + "\"}]}";
}

void RunLoop(factory::RuntimeDependencies& app) {
  const auto lal_bos = OddsEvent("lal-bos", "Los Angeles Lakers", "Boston Celtics", -150, 130);
  const auto mia_chi = OddsEvent("mia-chi", "Miami Heat", "Chicago Bulls", 120, -140);
  const auto events  = lal_bos + ", " + mia_chi;

  // morning: both markets near fair
  auto markets = Market("KX-LALBOS", "Celtics at Lakers", 56, 60) + ", " + Market("KX-MIACHI", "Bulls at Heat", 41, 45);
  app.collection->Collect(CollectorDoc("lal-bos", "2024-01-15T15:00:00Z", events, markets));
  app.collection->Collect(CollectorDoc("mia-chi", "2024-01-15T15:00:00Z", events, markets));

  // evening: Lakers drift down in the market, Heat get bid up
  markets = Market("KX-LALBOS", "Celtics at Lakers", 48, 52) + ", " + Market("KX-MIACHI", "Bulls at Heat", 50, 54);
  app.collection->Collect(CollectorDoc("lal-bos", "2024-01-15T23:00:00Z", events, markets));
  app.collection->Collect(CollectorDoc("mia-chi", "2024-01-15T23:00:00Z", events, markets));

  auto diff = app.collection->Diff(app.collection->Timeline("lal-bos")[0].snapshot_id, app.collection->Timeline("lal-bos")[1].snapshot_id);
  assert(diff.time_delta_seconds == 8 * 3600.0);
  assert(diff.changes.size() == 2);

  auto analyzed = app.analysis->AnalyzeAll();
  assert(analyzed.ok() && analyzed.succeeded.size() == 2);

  const auto analyses = app.store->ListAnalyses();
  assert(analyses.size() == 2);
  for (const auto& analysis : analyses) {
    assert(analysis.input_snapshot_ids.size() == 2);
    assert(*util::GetBool(analysis.conclusions, "edge_flagged"));
    assert(analysis.recommended_actions.values_size() == 1);
  }

  assert(app.evaluation->EvaluateAllPending().succeeded.empty());
  assert(app.outcomes->PendingGames().size() == 2);

  // Lakers win (home edge realized); Bulls win (fade of the Heat realized)
  app.outcomes->Ingest(ScoresDoc("lal-bos", "Los Angeles Lakers", "Boston Celtics", 112, 104));
  app.outcomes->Ingest(ScoresDoc("mia-chi", "Miami Heat", "Chicago Bulls", 98, 101));

  auto evaluated = app.evaluation->EvaluateAllPending();
  assert(evaluated.ok() && evaluated.succeeded.size() == 2);

  auto report = app.evaluation->Report();
  assert(report.total_evaluations == 2);
  assert(report.edge_wins == 2 && report.edge_losses == 0);
  assert(report.avg_roi.has_value() && *report.avg_roi > 0.0);
  assert(report.avg_brier_score.has_value() && *report.avg_brier_score > 0.0 && *report.avg_brier_score < 1.0);
  assert(report.interpretation.find("edge working") != std::string::npos);

  std::vector<std::string> evidence;
  for (const auto& evaluation : app.store->ListEvaluations()) evidence.push_back(evaluation.evaluation_id);

  auto proposal = app.proposals->Propose(R"({"based_on_evaluation_ids": [")" + evidence[0] + R"(", ")" + evidence[1] +
                                         R"("], "proposal_text": "Size stakes by edge magnitude", "expected_impact": "higher ROI"})");
  app.proposals->Transition(proposal.proposal_id, model::ProposalStatus::kAccepted);
  app.proposals->Transition(proposal.proposal_id, model::ProposalStatus::kImplemented);

  bool threw = false;
  try {
    app.proposals->Transition(proposal.proposal_id, model::ProposalStatus::kAccepted);
  } catch (const util::InvalidTransitionError&) {
    threw = true;
  }
  assert(threw);

  auto verification = app.verifier->Run();
  assert(verification.clean());
  // 4 snapshots, 2 analyses, 2 outcomes, 2 evaluations, 1 proposal
  assert(verification.total_checked() == 11);
}

} // namespace

int main() {
  {
    auto config = config::ConfigLoader::WithDefaults(config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
batch:
  workers: 2
)"));
    auto app = factory::BuildRuntime(config);
    RunLoop(app);
  }

#if SPORTSLEDGER_DB_SQLITE
  const auto path = std::filesystem::temp_directory_path() / ("sportsledger_loop_" + util::NewId() + ".db");
  {
    auto config = config::ConfigLoader::WithDefaults(config::ConfigLoader::LoadFromYamlString(
        "database:\n  sqlite:\n    path: \"" + path.string() + "\"\n    wal_mode: true\nbatch:\n  workers: 4\n"));
    auto app = factory::BuildRuntime(config);
    RunLoop(app);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
#endif

  std::cout << "sportsledger_integration_evaluation_loop: pass\n";
  return 0;
}
