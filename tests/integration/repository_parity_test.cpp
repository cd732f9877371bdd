#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/integrity/integrity_verifier.hpp"
#include "internal/model/record_hash.hpp"
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
using db::Repository;
using store::ImmutableStore;

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  std::function<void()>                        cleanup;
};

struct LedgerIds {
  model::Snapshot            early;
  model::Snapshot            late;
  model::Analysis            root;
  model::Analysis            child;
  model::Outcome             first;
  model::Outcome             corrected;
  model::Evaluation          evaluation;
  model::ImprovementProposal proposal;
};

model::Snapshot MakeSnapshot(const std::string& at, int bid) {
  model::Snapshot snapshot;
  snapshot.game_id                     = "game-1";
  snapshot.collected_at                = util::ParseTimestamp(at);
  snapshot.schema_version              = "1.0.0";
  snapshot.source_versions["odds_api"] = "v4";
  snapshot.source_versions["kalshi"]   = "v2";
  snapshot.raw_payloads                = util::ParseStruct(R"({"odds_api": [{"id": "game-1", "bookmakers": []}], "kalshi": {"markets": []}})");
  snapshot.normalized_fields = util::ParseStruct(R"({"sportsbook": {"best_home_odds": -150, "best_away_odds": 130, "commence_time": null},
      "prediction_market": {"yes_bid": )" + std::to_string(bid) + R"(, "title": "Celtics at Lakers ☃"}})");
  return snapshot;
}

// Same facts through either backend, with fixed stamps so results compare.
LedgerIds WriteLedger(ImmutableStore& store) {
  LedgerIds ids;
  ids.early = store.Insert(MakeSnapshot("2024-01-15T18:00:00Z", 55));
  ids.late  = store.Insert(MakeSnapshot("2024-01-15T19:00:00.123456Z", 48));

  model::Analysis root;
  root.created_at         = util::ParseTimestamp("2024-01-15T19:05:00Z");
  root.analysis_version   = "1.0.0";
  root.code_version       = "abc123";
  root.input_snapshot_ids = {ids.late.snapshot_id, ids.early.snapshot_id};
  root.derived_features   = util::ParseStruct(R"({"comparisons": [{"delta_home": -0.0798}], "game_id": "game-1"})");
  root.conclusions        = util::ParseStruct(R"({"edge_flagged": true, "delta_trend": null})");
  root.recommended_actions = util::ParseList(R"([{"side": "yes", "entry_price": 0.52, "stake": 1}])");
  ids.root                = store.Insert(root);

  model::Analysis child   = root;
  child.created_at         = util::ParseTimestamp("2024-01-15T19:10:00Z");
  child.analysis_version   = "1.1.0";
  child.model_version      = "no-vig-v2";
  child.parent_analysis_id = ids.root.analysis_id;
  ids.child                = store.Insert(child);

  model::Outcome first;
  first.game_id          = "game-1";
  first.occurred_at      = util::ParseTimestamp("2024-01-16T03:00:00Z");
  first.final_score.home = 104;
  first.final_score.away = 104;
  first.source           = "manual";
  ids.first              = store.Insert(first);

  model::Outcome corrected        = first;
  corrected.final_score.home      = 110;
  corrected.winner                = "Los Angeles Lakers";
  corrected.revision              = 2;
  corrected.supersedes_outcome_id = ids.first.outcome_id;
  corrected.stats_summary         = util::ParseStruct(R"({"overtime": true})");
  ids.corrected                   = store.Insert(corrected);

  model::Evaluation evaluation;
  evaluation.analysis_id           = ids.child.analysis_id;
  evaluation.outcome_id            = ids.corrected.outcome_id;
  evaluation.game_id               = "game-1";
  evaluation.scored_at             = util::ParseTimestamp("2024-01-16T04:00:00Z");
  evaluation.metrics.brier_score   = 0.176539;
  evaluation.metrics.log_loss      = 0.544998;
  evaluation.metrics.edge_realized = model::EdgeRealized::kRealized;
  evaluation.notes                 = util::ParseStruct(R"({"home_won": true})");
  ids.evaluation                   = store.Insert(evaluation);

  model::ImprovementProposal proposal;
  proposal.created_at                 = util::ParseTimestamp("2024-01-17T00:00:00Z");
  proposal.based_on_evaluation_ids    = {ids.evaluation.evaluation_id};
  proposal.proposal_text              = "Weight late line moves";
  proposal.suggested_modules          = util::ParseList(R"(["line_move_tracker"])");
  proposal.suggested_schema_additions = util::ParseList(R"([{"field": "closing_odds", "type": "number"}])");
  proposal.expected_impact            = "fewer false edges";
  ids.proposal                        = store.Insert(proposal);
  ids.proposal                        = store.UpdateProposalStatus(ids.proposal.proposal_id, model::ProposalStatus::kAccepted);
  return ids;
}

void VerifyReadBack(ImmutableStore& store, const LedgerIds& ids) {
  auto timeline = store.ListByGame("game-1");
  assert(timeline.size() == 2);
  assert(timeline[0].snapshot_id == ids.early.snapshot_id);
  assert(util::FormatTimestamp(timeline[1].collected_at) == "2024-01-15T19:00:00.123456Z");
  assert(timeline[1].source_versions == ids.late.source_versions);
  assert(util::GetStruct(timeline[1].normalized_fields, "prediction_market")->fields().at("title").string_value() == "Celtics at Lakers ☃");

  auto child = store.GetAnalysis(ids.child.analysis_id);
  assert(child.hash == ids.child.hash);
  assert(child.model_version == std::optional<std::string>("no-vig-v2"));
  assert(child.parent_analysis_id == std::optional<std::string>(ids.root.analysis_id));
  assert((child.input_snapshot_ids == std::vector<std::string>{ids.late.snapshot_id, ids.early.snapshot_id}));
  assert(child.recommended_actions.values_size() == 1);

  auto root = store.GetAnalysis(ids.root.analysis_id);
  assert(!root.model_version.has_value());
  assert(!root.parent_analysis_id.has_value());

  auto first = store.GetOutcome(ids.first.outcome_id);
  assert(!first.winner.has_value());
  assert(!first.supersedes_outcome_id.has_value());
  assert(store.CurrentOutcome("game-1")->outcome_id == ids.corrected.outcome_id);

  auto evaluation = store.GetEvaluation(ids.evaluation.evaluation_id);
  assert(!evaluation.metrics.roi.has_value());
  assert(evaluation.metrics.brier_score == 0.176539);
  assert(evaluation.metrics.edge_realized == model::EdgeRealized::kRealized);

  auto proposal = store.GetProposal(ids.proposal.proposal_id);
  assert(proposal.status == model::ProposalStatus::kAccepted);
  assert(proposal.hash == model::ComputeHash(proposal));
  assert(proposal.suggested_schema_additions.values_size() == 1);

  auto path = store.ListLineagePath(ids.child.analysis_id);
  assert(path.size() == 2 && path[0].analysis_id == ids.root.analysis_id);
}

void VerifyUncommittedWritesDisappear(Repository& repo) {
  auto snapshot        = MakeSnapshot("2024-01-20T00:00:00Z", 1);
  snapshot.snapshot_id = util::NewId();
  snapshot.hash        = model::ComputeHash(snapshot);
  {
    auto tx = repo.Begin();
    assert(repo.InsertSnapshot(*tx, snapshot));
    assert(repo.GetSnapshot(*tx, snapshot.snapshot_id).has_value());
  }
  auto tx = repo.Begin();
  assert(!repo.GetSnapshot(*tx, snapshot.snapshot_id).has_value());

  // hash uniqueness holds below the store as well
  assert(repo.InsertSnapshot(*tx, snapshot));
  auto twin        = snapshot;
  twin.snapshot_id = util::NewId();
  auto result      = repo.InsertSnapshot(*tx, twin);
  assert(!result);
  assert(result.code == db::ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyCleanLedger(const std::shared_ptr<Repository>& repo) {
  auto report = integrity::IntegrityVerifier(repo).Run();
  assert(report.clean());
  assert(report.total_checked() == 8);
  assert(report.checked.at(model::EntityType::kOutcome) == 2);
}

void RunBackend(const BackendFactory& backend, std::vector<LedgerIds>& results) {
  auto repo  = backend.make_repository();
  auto store = std::make_shared<ImmutableStore>(repo);

  results.push_back(WriteLedger(*store));
  VerifyReadBack(*store, results.back());
  VerifyUncommittedWritesDisappear(*repo);
  VerifyCleanLedger(repo);

  if (backend.cleanup) backend.cleanup();
  std::cout << "  " << backend.name << ": ok\n";
}

void VerifySameHashesEverywhere(const std::vector<LedgerIds>& results) {
  for (const auto& other : results) {
    const auto& first = results.front();
    assert(other.early.hash == first.early.hash);
    assert(other.late.hash == first.late.hash);
    assert(other.first.hash == first.first.hash);
    assert(other.proposal.status == first.proposal.status);
  }
}

#if SPORTSLEDGER_DB_SQLITE

std::filesystem::path TempLedger(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("sportsledger_" + name + "_" + util::NewId() + ".db");
}

void RemoveLedger(const std::filesystem::path& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}

std::shared_ptr<db::sqlite::SqliteDB> OpenLedger(const std::filesystem::path& path) {
  auto db = std::make_shared<db::sqlite::SqliteDB>(path.string(), true);
  db::sqlite::BootstrapSchema(*db);
  return db;
}

void TestSqliteSurvivesReopen() {
  const auto path = TempLedger("reopen");
  LedgerIds  ids;
  {
    auto store = ImmutableStore(std::make_shared<db::sqlite::SqliteRepository>(OpenLedger(path)));
    ids        = WriteLedger(store);
  }
  {
    auto repo  = std::make_shared<db::sqlite::SqliteRepository>(OpenLedger(path));
    auto store = ImmutableStore(repo);
    VerifyReadBack(store, ids);
    VerifyCleanLedger(repo);

    // the same facts again are recognised, not duplicated
    auto again = WriteLedger(store);
    assert(again.child.analysis_id == ids.child.analysis_id);
    assert(store.ListAnalyses().size() == 2);
  }
  RemoveLedger(path);
}

void TestSqliteSchemaRevision() {
  const auto path = TempLedger("revision");
  {
    auto db = OpenLedger(path);
    assert(db->UserVersion() == 1);
    // bootstrapping an existing ledger again is harmless
    db::sqlite::BootstrapSchema(*db);
    assert(db->UserVersion() == 1);
    db->SetUserVersion(2);
  }

  bool threw = false;
  try {
    OpenLedger(path);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("newer") != std::string::npos;
  }
  assert(threw);
  RemoveLedger(path);
}

void TestSqliteRefusesRawMutation() {
  const auto path = TempLedger("triggers");
  auto       db   = OpenLedger(path);
  auto       repo = std::make_shared<db::sqlite::SqliteRepository>(db);
  auto       ids  = [&] {
    ImmutableStore store(repo);
    return WriteLedger(store);
  }();

  const auto refused = [&](const std::string& sql) {
    try {
      db->Exec(sql);
    } catch (const std::runtime_error&) {
      return true;
    }
    return false;
  };

  assert(refused("UPDATE info_snapshots SET game_id = 'other' WHERE snapshot_id = '" + ids.early.snapshot_id + "';"));
  assert(refused("DELETE FROM outcomes WHERE outcome_id = '" + ids.first.outcome_id + "';"));
  assert(refused("UPDATE improvement_proposals SET proposal_text = 'rewritten';"));
  assert(refused("UPDATE improvement_proposals SET status = 'pending';"));

  // backward transition below the store
  {
    auto tx     = repo->Begin();
    auto result = repo->UpdateProposalStatus(*tx, ids.proposal.proposal_id, model::ProposalStatus::kPending, ids.proposal.hash);
    assert(!result);
  }
  RemoveLedger(path);
}

void TestVerifierFindsTamperedRows() {
  const auto path = TempLedger("tamper");
  auto       db   = OpenLedger(path);
  auto       repo = std::make_shared<db::sqlite::SqliteRepository>(db);
  auto       store = std::make_shared<ImmutableStore>(repo);
  auto       ids   = WriteLedger(*store);

  db->Exec("DROP TRIGGER info_snapshots_no_update;");
  db->Exec("UPDATE info_snapshots SET normalized_fields = '{}' WHERE snapshot_id = '" + ids.late.snapshot_id + "';");
  db->Exec("DROP TRIGGER outcomes_no_update;");
  db->Exec("UPDATE outcomes SET home_score = 99 WHERE outcome_id = '" + ids.corrected.outcome_id + "';");

  auto report = integrity::IntegrityVerifier(repo).Run();
  assert(!report.clean());
  assert(report.total_checked() == 8);
  assert(report.mismatches.size() == 2);
  assert(report.mismatches[0].entity_type == model::EntityType::kSnapshot);
  assert(report.mismatches[0].id == ids.late.snapshot_id);
  assert(report.mismatches[0].expected == ids.late.hash);
  assert(report.mismatches[1].entity_type == model::EntityType::kOutcome);

  bool threw = false;
  try {
    (void)store->GetSnapshot(ids.late.snapshot_id);
  } catch (const util::HashMismatchError& e) {
    threw = e.id() == ids.late.snapshot_id;
  }
  assert(threw && "Reads re-verify stored hashes.");

  // untouched rows still read fine
  assert(store->GetSnapshot(ids.early.snapshot_id).hash == ids.early.hash);
  RemoveLedger(path);
}

void TestVerifierSurvivesUndecodableRows() {
  const auto path  = TempLedger("garbled");
  auto       db    = OpenLedger(path);
  auto       repo  = std::make_shared<db::sqlite::SqliteRepository>(db);
  auto       store = std::make_shared<ImmutableStore>(repo);
  auto       ids   = WriteLedger(*store);

  db->Exec("DROP TRIGGER analyses_no_update;");
  db->Exec("UPDATE analyses SET derived_features = '{\"comparisons\": [' WHERE analysis_id = '" + ids.root.analysis_id +
           "';");
  db->Exec("DROP TRIGGER info_snapshots_no_update;");
  db->Exec("UPDATE info_snapshots SET normalized_fields = 'not json' WHERE snapshot_id = '" + ids.early.snapshot_id +
           "';");

  auto report = integrity::IntegrityVerifier(repo).Run();
  assert(report.total_checked() == 8 && "Unreadable rows still count as checked.");
  assert(report.mismatches.size() == 2);
  assert(report.mismatches[0].entity_type == model::EntityType::kSnapshot);
  assert(report.mismatches[0].id == ids.early.snapshot_id);
  assert(report.mismatches[0].expected == ids.early.hash);
  assert(report.mismatches[0].actual.rfind("<undecodable: ", 0) == 0);
  assert(report.mismatches[1].entity_type == model::EntityType::kAnalysis);
  assert(report.mismatches[1].id == ids.root.analysis_id);
  assert(report.mismatches[1].expected == ids.root.hash);
  assert(report.mismatches[1].actual.rfind("<undecodable: ", 0) == 0);

  // rows after the garbled ones were still verified
  assert(report.checked.at(model::EntityType::kProposal) == 1);
  assert(store->GetAnalysis(ids.child.analysis_id).hash == ids.child.hash);
  RemoveLedger(path);
}

#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back({"memory", [] { return std::make_shared<db::memory::MemoryRepository>(); }, nullptr});

#if SPORTSLEDGER_DB_SQLITE
  const auto sqlite_path = TempLedger("parity");
  backends.push_back({"sqlite",
                      [&] { return std::make_shared<db::sqlite::SqliteRepository>(OpenLedger(sqlite_path)); },
                      [&] { RemoveLedger(sqlite_path); }});
#endif

  std::vector<LedgerIds> results;
  for (const auto& backend : backends) {
    RunBackend(backend, results);
  }
  VerifySameHashesEverywhere(results);

#if SPORTSLEDGER_DB_SQLITE
  TestSqliteSurvivesReopen();
  TestSqliteSchemaRevision();
  TestSqliteRefusesRawMutation();
  TestVerifierFindsTamperedRows();
  TestVerifierSurvivesUndecodableRows();
#endif

  std::cout << "sportsledger_integration_repository_parity: pass\n";
  return 0;
}
