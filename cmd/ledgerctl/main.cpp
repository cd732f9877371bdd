#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/payload_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

using sportsledger::factory::BuildRuntime;
using sportsledger::factory::RuntimeDependencies;

namespace util = sportsledger::util;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl [--config <config.yaml>] <command>\n"
            << "\n"
            << "  init\n"
            << "  collect <payload.json>\n"
            << "  timeline <game_id> [as_of]\n"
            << "  diff <older_snapshot_id> <newer_snapshot_id> [--all]\n"
            << "  analyze <game_id> [parent_analysis_id]\n"
            << "  analyze --all\n"
            << "  ingest-outcome <outcome.json>\n"
            << "  correct-outcome <outcome.json>\n"
            << "  pending-outcomes\n"
            << "  evaluate <analysis_id>\n"
            << "  evaluate --all\n"
            << "  report\n"
            << "  lineage <analysis_id>\n"
            << "  propose <proposal.json>\n"
            << "  proposal-status <proposal_id> <pending|accepted|rejected|implemented>\n"
            << "  verify\n";
}

static sportsledger::runtime::config::RuntimeConfig DefaultConfig() {
  sportsledger::runtime::config::RuntimeConfig config;
#if SPORTSLEDGER_DB_SQLITE
  config.mutable_database()->mutable_sqlite()->set_path("sportsledger.db");
#endif
  return config;
}

static int PrintBatch(const sportsledger::service::BatchReport& report) {
  std::cout << util::ToJson(report.ToStruct()) << "\n";
  return report.ok() ? 0 : 2;
}

static void PrintAnalysis(const sportsledger::model::Analysis& analysis) {
  std::cout << "analysis_id=" << analysis.analysis_id << "\n"
            << "created_at=" << util::FormatTimestamp(analysis.created_at) << "\n"
            << "parent=" << analysis.parent_analysis_id.value_or("") << "\n"
            << "inputs=" << analysis.input_snapshot_ids.size() << "\n"
            << "hash=" << analysis.hash << "\n"
            << "conclusions=" << util::ToJson(analysis.conclusions) << "\n"
            << "recommended_actions=" << util::ToJson(analysis.recommended_actions) << "\n";
}

static int Run(RuntimeDependencies& app, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "init") {
    std::cout << "initialized\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "collect") {
    if (args.size() < 2) return 1;

    auto snapshot = app.collection->Collect(util::ReadFile(args[1]));
    std::cout << "snapshot_id=" << snapshot.snapshot_id << "\n"
              << "game_id=" << snapshot.game_id << "\n"
              << "collected_at=" << util::FormatTimestamp(snapshot.collected_at) << "\n"
              << "hash=" << snapshot.hash << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "timeline") {
    if (args.size() < 2) return 1;

    std::optional<util::TimePoint> as_of;
    if (args.size() >= 3) as_of = util::ParseTimestamp(args[2]);

    for (const auto& snapshot : app.collection->Timeline(args[1], as_of)) {
      std::cout << util::FormatTimestamp(snapshot.collected_at) << " " << snapshot.snapshot_id << " " << snapshot.hash << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "diff") {
    if (args.size() < 3) return 1;

    const bool all  = args.size() >= 4 && args[3] == "--all";
    auto       diff = app.collection->Diff(args[1], args[2], all);
    std::cout << "game_id=" << diff.game_id << "\n"
              << "time_delta_seconds=" << diff.time_delta_seconds << "\n";
    for (const auto& change : diff.changes) {
      std::cout << sportsledger::delta::ToString(change.kind) << " " << change.path;
      if (change.old_value) std::cout << " old=" << util::ToJson(*change.old_value);
      if (change.new_value) std::cout << " new=" << util::ToJson(*change.new_value);
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "analyze") {
    if (args.size() < 2) return 1;

    if (args[1] == "--all") {
      return PrintBatch(app.analysis->AnalyzeAll());
    }

    std::optional<std::string> parent;
    if (args.size() >= 3) parent = args[2];

    auto analysis = app.analysis->AnalyzeGame(args[1], parent);
    if (!analysis) {
      std::cout << "no sportsbook line for " << args[1] << "\n";
      return 0;
    }
    PrintAnalysis(*analysis);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ingest-outcome" || cmd == "correct-outcome") {
    if (args.size() < 2) return 1;

    const auto payload = util::ReadFile(args[1]);
    auto       outcome = cmd == "ingest-outcome" ? app.outcomes->Ingest(payload)
                                                 : app.outcomes->Correct(sportsledger::ingest::ParseOutcomePayload(payload));
    std::cout << "outcome_id=" << outcome.outcome_id << "\n"
              << "game_id=" << outcome.game_id << "\n"
              << "revision=" << outcome.revision << "\n"
              << "final_score=" << outcome.final_score.away << "-" << outcome.final_score.home << "\n"
              << "winner=" << outcome.winner.value_or("tie") << "\n"
              << "hash=" << outcome.hash << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pending-outcomes") {
    for (const auto& game_id : app.outcomes->PendingGames()) {
      std::cout << game_id << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "evaluate") {
    if (args.size() < 2) return 1;

    if (args[1] == "--all") {
      return PrintBatch(app.evaluation->EvaluateAllPending());
    }

    auto evaluation = app.evaluation->Evaluate(args[1]);
    const auto& m   = evaluation.metrics;
    std::cout << "evaluation_id=" << evaluation.evaluation_id << "\n"
              << "outcome_id=" << evaluation.outcome_id << "\n"
              << "brier_score=" << m.brier_score.value_or(0.0) << "\n"
              << "log_loss=" << m.log_loss.value_or(0.0) << "\n"
              << "roi=" << (m.roi ? std::to_string(*m.roi) : std::string("none")) << "\n"
              << "edge_realized=" << sportsledger::model::ToString(m.edge_realized) << "\n"
              << "notes=" << util::ToJson(evaluation.notes) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report") {
    std::cout << util::ToJson(app.evaluation->Report().ToStruct()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lineage") {
    if (args.size() < 2) return 1;

    std::size_t depth = 0;
    for (const auto& analysis : app.analysis->Lineage(args[1])) {
      std::cout << std::string(depth * 2, ' ') << analysis.analysis_id << " " << util::FormatTimestamp(analysis.created_at) << " "
                << analysis.analysis_version << "\n";
      ++depth;
    }
    for (const auto& child : app.analysis->Children(args[1])) {
      std::cout << std::string(depth * 2, ' ') << "child " << child.analysis_id << "\n";
    }
    std::cout << "descendants=" << app.analysis->Descendants(args[1]).size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "propose") {
    if (args.size() < 2) return 1;

    auto proposal = app.proposals->Propose(util::ReadFile(args[1]));
    std::cout << "proposal_id=" << proposal.proposal_id << "\n"
              << "status=" << sportsledger::model::ToString(proposal.status) << "\n"
              << "hash=" << proposal.hash << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "proposal-status") {
    if (args.size() < 3) return 1;

    sportsledger::model::ProposalStatus status;
    try {
      status = sportsledger::model::ParseProposalStatus(args[2]);
    } catch (const std::invalid_argument& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }

    auto proposal = app.proposals->Transition(args[1], status);
    std::cout << "proposal_id=" << proposal.proposal_id << "\n"
              << "status=" << sportsledger::model::ToString(proposal.status) << "\n"
              << "hash=" << proposal.hash << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "verify") {
    auto report = app.verifier->Run();
    for (const auto& [entity, count] : report.checked) {
      std::cout << "checked " << sportsledger::model::EntityName(entity) << "=" << count << "\n";
    }
    for (const auto& mismatch : report.mismatches) {
      std::cout << "MISMATCH " << sportsledger::model::EntityName(mismatch.entity_type) << " " << mismatch.id
                << " expected=" << mismatch.expected << " actual=" << mismatch.actual << "\n";
    }
    std::cout << (report.clean() ? "ok" : "corrupted") << "\n";
    return report.clean() ? 0 : 2;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sportsledger::config::ConfigLoader::WithDefaults(
        config_path ? sportsledger::config::ConfigLoader::LoadFromYaml(*config_path) : DefaultConfig());

    sportsledger::observability::InitializeLogging(config);

    auto app = BuildRuntime(config);
    int  rc  = Run(app, args);
    if (rc == 1) Usage();

    sportsledger::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    SPORTSLEDGER_LOG_ERROR("Command failed", {sportsledger::observability::StringField("command", args[0]),
                                              sportsledger::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    sportsledger::observability::ShutdownLogging();
    return 2;
  }
}
