#include <assert.h>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/ingest/payload_normalizer.hpp"
#include "internal/service/batch_runner.hpp"
#include "internal/service/work_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace sportsledger;
using service::BatchRunner;
using service::UnitStatus;

std::string CollectorDoc(const std::string& game_id, const std::string& at, int bid, int ask, bool with_book = true) {
  std::string providers;
  if (with_book) {
    providers += R"("odds_api": {"version": "v4", "payload": [{"id": ")" + game_id +
                 R"(", "home_team": "Los Angeles Lakers", "away_team": "Boston Celtics", "bookmakers": [
                   {"key": "fanduel", "markets": [{"key": "h2h", "outcomes": [
                     {"name": "Los Angeles Lakers", "price": -150}, {"name": "Boston Celtics", "price": 130}]}]}]}]}, )";
  }
  providers += R"("kalshi": {"version": "v2", "payload": {"markets": [{"ticker": "KX-)" + game_id +
               R"(", "title": "Celtics at Lakers", "yes_bid": )" + std::to_string(bid) + R"(, "yes_ask": )" + std::to_string(ask) +
               "}]}}";
  return R"({"game_id": ")" + game_id + R"(", "collected_at": ")" + at + R"(", "providers": {)" + providers + "}}";
}

std::string OutcomeDoc(const std::string& game_id, const std::string& winner) {
  return R"({"game_id": ")" + game_id + R"(", "occurred_at": "2024-01-16T03:00:00Z", "final_score": {"home": 110, "away": 102},
      "winner": ")" + winner + R"(", "source": "manual"})";
}

factory::RuntimeDependencies MakeRuntime(uint32_t workers) {
  sportsledger::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_batch()->set_workers(workers);
  return factory::BuildRuntime(config);
}

void TestWorkQueueDrainsAfterClose() {
  service::WorkQueue queue;
  queue.Enqueue(1);
  queue.Enqueue(2);
  queue.Close();
  assert(queue.Dequeue() == std::optional<std::size_t>(1));
  assert(queue.Dequeue() == std::optional<std::size_t>(2));
  assert(!queue.Dequeue().has_value());
}

void TestRunnerKeepsInputOrderAndRecordsFailures() {
  std::vector<std::string> units;
  for (int i = 0; i < 20; ++i) units.push_back("unit-" + std::to_string(i));

  std::atomic<int> calls{0};
  BatchRunner      runner(4);
  auto report = runner.Run("test", units, [&](const std::string& unit) {
    ++calls;
    if (unit == "unit-3" || unit == "unit-11") throw std::runtime_error("boom " + unit);
    if (unit == "unit-5") return UnitStatus::kSkipped;
    return UnitStatus::kDone;
  });

  assert(calls.load() == 20);
  assert(!report.ok());
  assert(report.failed.size() == 2);
  assert(report.failed[0].unit == "unit-3" && report.failed[0].error == "boom unit-3");
  assert(report.failed[1].unit == "unit-11");
  assert((report.skipped == std::vector<std::string>{"unit-5"}));
  assert(report.succeeded.size() == 17);
  assert(report.succeeded.front() == "unit-0" && report.succeeded.back() == "unit-19");

  auto empty = BatchRunner(8).Run("empty", {}, [](const std::string&) { return UnitStatus::kDone; });
  assert(empty.ok() && empty.succeeded.empty());
}

void TestAnalyzeAllSkipsGamesWithoutLine() {
  auto app = MakeRuntime(4);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 48, 52));
  app.collection->Collect(CollectorDoc("g2", "2024-01-15T18:00:00Z", 55, 59));
  app.collection->Collect(CollectorDoc("g3", "2024-01-15T18:00:00Z", 50, 54, false));

  auto report = app.analysis->AnalyzeAll();
  assert(report.ok());
  assert((report.succeeded == std::vector<std::string>{"g1", "g2"}));
  assert((report.skipped == std::vector<std::string>{"g3"}));
  assert(app.store->ListAnalyses().size() == 2);

  // nothing new collected, so a rerun stores nothing new
  app.analysis->AnalyzeAll();
  assert(app.store->ListAnalyses().size() == 2);

  bool threw = false;
  try {
    (void)app.analysis->AnalyzeGame("unknown-game");
  } catch (const util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void TestEvaluateAllPendingAndCorrections() {
  auto app = MakeRuntime(3);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 48, 52));
  app.collection->Collect(CollectorDoc("g2", "2024-01-15T18:00:00Z", 55, 59));
  assert(app.analysis->AnalyzeAll().ok());

  assert(app.evaluation->PendingAnalyses().empty());
  assert((app.outcomes->PendingGames() == std::vector<std::string>{"g1", "g2"}));

  const auto analyses = app.store->ListAnalyses();
  bool       threw    = false;
  try {
    (void)app.evaluation->Evaluate(analyses.front().analysis_id);
  } catch (const util::NotFoundError&) {
    threw = true;
  }
  assert(threw && "Evaluation needs an outcome.");

  auto g1 = app.outcomes->Ingest(OutcomeDoc("g1", "Los Angeles Lakers"));
  app.outcomes->Ingest(OutcomeDoc("g2", "Boston Celtics"));
  assert(app.outcomes->PendingGames().empty());

  auto first = app.evaluation->EvaluateAllPending();
  assert(first.ok() && first.succeeded.size() == 2);
  assert(app.evaluation->EvaluateAllPending().succeeded.empty());

  auto report = app.evaluation->Report();
  assert(report.total_evaluations == 2);
  assert(report.edge_wins == 1 && report.edge_losses == 0 && report.edge_no_signal == 1);

  // the corrected result re-opens g1 and replaces its evaluation in the report
  auto corrected = ingest::ParseOutcomePayload(OutcomeDoc("g1", "Boston Celtics"));
  auto second    = app.outcomes->Correct(corrected);
  assert(second.revision == 2);
  assert(second.supersedes_outcome_id == std::optional<std::string>(g1.outcome_id));
  assert(app.outcomes->Current("g1")->outcome_id == second.outcome_id);

  assert(app.evaluation->PendingAnalyses().size() == 1);
  assert(app.evaluation->EvaluateAllPending().ok());

  report = app.evaluation->Report();
  assert(report.total_evaluations == 2);
  assert(report.edge_wins == 0 && report.edge_losses == 1);
  assert(app.store->ListEvaluations().size() == 3);
}

void TestFailingUnitDoesNotStopBatch() {
  auto app = MakeRuntime(2);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 48, 52));
  auto snapshot = app.collection->Timeline("g1").front();
  assert(app.analysis->AnalyzeGame("g1").has_value());

  // an analysis without comparisons cannot be scored
  model::Analysis bare;
  bare.analysis_version   = "0.0.1";
  bare.code_version       = "manual";
  bare.input_snapshot_ids = {snapshot.snapshot_id};
  bare                    = app.store->Insert(bare);

  app.outcomes->Ingest(OutcomeDoc("g1", "Los Angeles Lakers"));

  auto report = app.evaluation->EvaluateAllPending();
  assert(report.succeeded.size() == 1);
  assert(report.failed.size() == 1);
  assert(report.failed[0].unit == bare.analysis_id);
  assert(app.store->ListEvaluations().size() == 1);

  const auto out = report.ToStruct();
  assert(util::GetList(out, "failed")->values_size() == 1);
}

void TestDamagedAnalysisFailsOnlyItsUnit() {
  auto app = MakeRuntime(2);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 48, 52));
  app.collection->Collect(CollectorDoc("g2", "2024-01-15T18:00:00Z", 55, 59));
  assert(app.analysis->AnalyzeAll().ok());
  const auto snapshot = app.collection->Timeline("g1").front();

  // a row whose stored hash no longer matches its content
  model::Analysis damaged;
  damaged.analysis_id        = "damaged-analysis";
  damaged.created_at         = util::ParseTimestamp("2024-01-15T18:30:00Z");
  damaged.analysis_version   = "1.0.0";
  damaged.code_version       = "manual";
  damaged.input_snapshot_ids = {snapshot.snapshot_id};
  damaged.hash               = std::string(64, '0');
  {
    auto tx       = app.repository->Begin();
    auto inserted = app.repository->InsertAnalysis(*tx, damaged);
    assert(inserted);
    tx->Commit();
  }

  app.outcomes->Ingest(OutcomeDoc("g1", "Los Angeles Lakers"));
  app.outcomes->Ingest(OutcomeDoc("g2", "Boston Celtics"));

  auto report = app.evaluation->EvaluateAllPending();
  assert(report.succeeded.size() == 2 && "Intact analyses are still scored.");
  assert(report.failed.size() == 1);
  assert(report.failed[0].unit == damaged.analysis_id);
  assert(app.store->ListEvaluations().size() == 2);

  // nothing left but the damaged one
  report = app.evaluation->EvaluateAllPending();
  assert(report.succeeded.empty());
  assert(report.skipped.size() == 2);
  assert(report.failed.size() == 1);
}

void TestReanalysisBuildsLineage() {
  auto app = MakeRuntime(1);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 55, 59));
  auto root = app.analysis->AnalyzeGame("g1");
  assert(root.has_value());

  app.collection->Collect(CollectorDoc("g1", "2024-01-15T19:00:00Z", 48, 52));
  auto child = app.analysis->AnalyzeGame("g1", root->analysis_id);
  assert(child.has_value());
  assert(child->input_snapshot_ids.size() == 2);

  // what was known before the second snapshot
  auto earlier = app.analysis->AnalyzeGame("g1", std::nullopt, util::ParseTimestamp("2024-01-15T18:30:00Z"));
  assert(earlier->analysis_id == root->analysis_id);

  auto path = app.analysis->Lineage(child->analysis_id);
  assert(path.size() == 2);
  assert(path[0].analysis_id == root->analysis_id);

  assert(app.analysis->Children(root->analysis_id).size() == 1);
  assert((app.analysis->Descendants(root->analysis_id) == std::vector<std::string>{child->analysis_id}));
  assert(app.analysis->Descendants(child->analysis_id).empty());

  const auto timeline = app.collection->Timeline("g1");
  auto       diff     = app.collection->Diff(timeline[0].snapshot_id, timeline[1].snapshot_id);
  assert(diff.time_delta_seconds == 3600.0);
  assert(diff.changes.size() == 2);
  assert(app.collection->Diff(timeline[0].snapshot_id, timeline[1].snapshot_id, true).changes.size() > 2);
}

void TestProposalsThroughService() {
  auto app = MakeRuntime(1);
  app.collection->Collect(CollectorDoc("g1", "2024-01-15T18:00:00Z", 48, 52));
  app.analysis->AnalyzeAll();
  app.outcomes->Ingest(OutcomeDoc("g1", "Los Angeles Lakers"));
  app.evaluation->EvaluateAllPending();

  const auto evaluation = app.store->ListEvaluations().front();
  auto proposal = app.proposals->Propose(R"({"based_on_evaluation_ids": [")" + evaluation.evaluation_id +
                                         R"("], "proposal_text": "Track closing line value"})");
  assert(app.proposals->List().size() == 1);

  auto accepted = app.proposals->Transition(proposal.proposal_id, model::ProposalStatus::kAccepted);
  assert(accepted.status == model::ProposalStatus::kAccepted);
  assert(app.proposals->List().front().status == model::ProposalStatus::kAccepted);
}

} // namespace

int main() {
  TestWorkQueueDrainsAfterClose();
  TestRunnerKeepsInputOrderAndRecordsFailures();
  TestAnalyzeAllSkipsGamesWithoutLine();
  TestEvaluateAllPendingAndCorrections();
  TestFailingUnitDoesNotStopBatch();
  TestDamagedAnalysisFailsOnlyItsUnit();
  TestReanalysisBuildsLineage();
  TestProposalsThroughService();

  std::cout << "sportsledger_unit_batch_services: pass\n";
  return 0;
}
