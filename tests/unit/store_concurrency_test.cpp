#include <assert.h>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/immutable_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#if SPORTSLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using namespace sportsledger;
using store::ImmutableStore;

constexpr int kThreads = 8;

model::Snapshot MakeSnapshot(const std::string& game_id) {
  model::Snapshot snapshot;
  snapshot.game_id           = game_id;
  snapshot.collected_at      = util::ParseTimestamp("2024-01-15T18:00:00Z");
  snapshot.schema_version    = "1.0.0";
  snapshot.normalized_fields = util::ParseStruct(R"({"sportsbook": {"best_home_odds": -150, "best_away_odds": 130}})");
  return snapshot;
}

model::Outcome MakeOutcome(int64_t home) {
  model::Outcome outcome;
  outcome.game_id          = "game-1";
  outcome.occurred_at      = util::ParseTimestamp("2024-01-16T03:00:00Z");
  outcome.final_score.home = home;
  outcome.final_score.away = 90;
  outcome.winner           = "Home";
  outcome.source           = "manual";
  return outcome;
}

template <typename Fn>
void RunConcurrently(Fn&& fn) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      fn(i);
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();
}

void TestIdenticalSnapshotsRaceToOneRecord(const std::shared_ptr<ImmutableStore>& store) {
  std::vector<std::string> ids(kThreads);
  RunConcurrently([&](int i) { ids[i] = store->Insert(MakeSnapshot("race-game")).snapshot_id; });

  const std::set<std::string> distinct(ids.begin(), ids.end());
  assert(distinct.size() == 1);
  assert(store->ListByGame("race-game").size() == 1);
}

void TestManyDistinctKeysAllLand(const std::shared_ptr<ImmutableStore>& store) {
  constexpr int kPerThread = 40;
  RunConcurrently([&](int i) {
    for (int n = 0; n < kPerThread; ++n) {
      store->Insert(MakeSnapshot("spread-" + std::to_string(i) + "-" + std::to_string(n)));
      // every thread also races on the shared one
      store->Insert(MakeSnapshot("spread-shared"));
    }
  });

  for (int i = 0; i < kThreads; ++i) {
    for (int n = 0; n < kPerThread; ++n) {
      assert(store->ListByGame("spread-" + std::to_string(i) + "-" + std::to_string(n)).size() == 1);
    }
  }
  assert(store->ListByGame("spread-shared").size() == 1);
}

void TestCompetingFirstOutcomesAdmitOne(const std::shared_ptr<ImmutableStore>& store) {
  std::atomic<int> stored{0};
  std::atomic<int> rejected{0};
  RunConcurrently([&](int i) {
    try {
      store->Insert(MakeOutcome(100 + i));
      ++stored;
    } catch (const util::UniquenessError&) {
      ++rejected;
    }
  });

  assert(stored.load() == 1);
  assert(rejected.load() == kThreads - 1);
  assert(store->ListOutcomes("game-1").size() == 1);
}

void TestCompetingTransitionsAdmitOne(const std::shared_ptr<ImmutableStore>& store) {
  auto snapshot = store->Insert(MakeSnapshot("proposal-game"));

  model::Analysis analysis;
  analysis.analysis_version   = "1.0.0";
  analysis.code_version       = "abc123";
  analysis.input_snapshot_ids = {snapshot.snapshot_id};
  analysis                    = store->Insert(analysis);

  auto outcome    = MakeOutcome(101);
  outcome.game_id = "proposal-game";
  outcome         = store->Insert(outcome);

  model::Evaluation evaluation;
  evaluation.analysis_id = analysis.analysis_id;
  evaluation.outcome_id  = outcome.outcome_id;
  evaluation.game_id     = outcome.game_id;
  evaluation             = store->Insert(evaluation);

  model::ImprovementProposal proposal;
  proposal.based_on_evaluation_ids = {evaluation.evaluation_id};
  proposal.proposal_text           = "Use closing lines";
  proposal                         = store->Insert(proposal);

  std::atomic<int> moved{0};
  std::atomic<int> refused{0};
  RunConcurrently([&](int) {
    try {
      store->UpdateProposalStatus(proposal.proposal_id, model::ProposalStatus::kAccepted);
      ++moved;
    } catch (const util::InvalidTransitionError&) {
      ++refused;
    }
  });

  assert(moved.load() == 1);
  assert(refused.load() == kThreads - 1);
  assert(store->GetProposal(proposal.proposal_id).status == model::ProposalStatus::kAccepted);
}

void RunAll(const std::shared_ptr<ImmutableStore>& store) {
  TestIdenticalSnapshotsRaceToOneRecord(store);
  TestManyDistinctKeysAllLand(store);
  TestCompetingFirstOutcomesAdmitOne(store);
  TestCompetingTransitionsAdmitOne(store);
}

} // namespace

int main() {
  RunAll(std::make_shared<ImmutableStore>(std::make_shared<db::memory::MemoryRepository>()));

#if SPORTSLEDGER_DB_SQLITE
  const auto path = std::filesystem::temp_directory_path() / ("sportsledger_concurrency_" + util::NewId() + ".db");
  {
    auto db = std::make_shared<db::sqlite::SqliteDB>(path.string(), true);
    db::sqlite::BootstrapSchema(*db);
    RunAll(std::make_shared<ImmutableStore>(std::make_shared<db::sqlite::SqliteRepository>(db)));
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
#endif

  std::cout << "sportsledger_unit_store_concurrency: pass\n";
  return 0;
}
