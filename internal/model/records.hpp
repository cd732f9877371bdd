#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/proposal_status.hpp"
#include "internal/util/time.hpp"

namespace sportsledger::model {

/*
  Ledger records.

  Every record is a value: once the store has accepted it nothing about it
  changes, with the single exception of ImprovementProposal::status. Ids,
  hashes and creation stamps left empty by the caller are assigned by the
  store on insert.
*/

enum class EntityType { kSnapshot, kAnalysis, kOutcome, kEvaluation, kProposal };

constexpr std::string_view EntityName(EntityType type) {
  switch (type) {
    case EntityType::kSnapshot:
      return "snapshot";
    case EntityType::kAnalysis:
      return "analysis";
    case EntityType::kOutcome:
      return "outcome";
    case EntityType::kEvaluation:
      return "evaluation";
    case EntityType::kProposal:
      return "proposal";
  }
  return "unknown";
}

// What was known about one game at one moment.
struct Snapshot {
  std::string                        snapshot_id;
  std::string                        game_id;
  util::TimePoint                    collected_at{};
  std::string                        schema_version;
  std::map<std::string, std::string> source_versions; // provider -> version
  google::protobuf::Struct           raw_payloads;    // provider -> verbatim payload
  google::protobuf::Struct           normalized_fields;
  std::string                        hash;
};

// Derived reasoning over one or more snapshots of a single game.
struct Analysis {
  std::string                 analysis_id;
  util::TimePoint             created_at{};
  std::string                 analysis_version;
  std::string                 code_version;
  std::optional<std::string>  model_version;
  std::optional<std::string>  parent_analysis_id;
  std::vector<std::string>    input_snapshot_ids;
  google::protobuf::Struct    derived_features;
  google::protobuf::Struct    conclusions;
  google::protobuf::ListValue recommended_actions;
  std::string                 hash;
};

struct FinalScore {
  int64_t home = 0;
  int64_t away = 0;
};

/*
  Ground truth for a game.

  revision 1 is the first report; a correction is a new Outcome with
  revision n + 1 whose supersedes_outcome_id names revision n.
*/
struct Outcome {
  std::string                outcome_id;
  std::string                game_id;
  util::TimePoint            occurred_at{};
  FinalScore                 final_score;
  std::optional<std::string> winner; // empty = tie
  google::protobuf::Struct   stats_summary;
  std::string                source;
  int64_t                    revision = 1;
  std::optional<std::string> supersedes_outcome_id;
  std::string                hash;
};

enum class EdgeRealized { kNoSignal, kRealized, kMissed };

std::string_view ToString(EdgeRealized value);
EdgeRealized     ParseEdgeRealized(std::string_view text);

struct EvaluationMetrics {
  std::optional<double> brier_score;
  std::optional<double> log_loss;
  std::optional<double> roi;
  EdgeRealized          edge_realized = EdgeRealized::kNoSignal;
};

struct Evaluation {
  std::string              evaluation_id;
  std::string              analysis_id;
  std::string              outcome_id;
  std::string              game_id;
  util::TimePoint          scored_at{};
  EvaluationMetrics        metrics;
  google::protobuf::Struct notes;
  std::string              hash;
};

struct ImprovementProposal {
  std::string                 proposal_id;
  util::TimePoint             created_at{};
  std::vector<std::string>    based_on_evaluation_ids;
  std::string                 proposal_text;
  google::protobuf::ListValue suggested_schema_additions;
  google::protobuf::ListValue suggested_modules;
  std::string                 expected_impact;
  ProposalStatus              status = ProposalStatus::kPending;
  std::string                 hash;
};

} // namespace sportsledger::model
