#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/records.hpp"

namespace sportsledger::ingest {

/*
  Boundary between external collaborators and the ledger.

  The collector, the outcome source and proposal authors hand over JSON
  documents; this module turns them into unsaved records. Transport is
  somebody else's problem. Malformed documents throw std::runtime_error
  (unparseable JSON) or std::invalid_argument (missing or mistyped
  fields).

  Collector document:
    { "game_id": "...", "collected_at": "RFC3339"?,
      "providers": { "<name>": { "version": "...", "payload": <any> } } }

  Outcome document, either explicit
    { "game_id", "occurred_at", "final_score": {"home", "away"},
      "winner"?, "stats_summary"?, "source", "revision"?,
      "supersedes_outcome_id"? }
  or a completed odds_api score entry
    { "id", "completed": true, "home_team", "away_team",
      "commence_time", "scores": [{"name", "score"}] }

  Proposal document:
    { "based_on_evaluation_ids": [...], "proposal_text",
      "suggested_schema_additions"?, "suggested_modules"?,
      "expected_impact"? }
*/

inline constexpr char kOddsApiProvider[] = "odds_api";
inline constexpr char kKalshiProvider[]  = "kalshi";

// Full lowercased name, plus the nickname when the last word is not a
// city word ("Los Angeles Lakers" -> {"los angeles lakers", "lakers"}).
std::vector<std::string> TeamKeywords(std::string_view team_name);

bool TitleMatchesTeams(std::string_view title, std::string_view home_team, std::string_view away_team);

// Best h2h price per side across bookmakers for the event whose id is
// game_id. payload is an event list, {"events": [...]} or one event.
std::optional<google::protobuf::Struct> NormalizeSportsbook(const google::protobuf::Value& payload, const std::string& game_id);

// First market whose title names both teams. payload is {"markets": [...]}
// or a market list.
std::optional<google::protobuf::Struct> NormalizePredictionMarket(const google::protobuf::Value& payload,
                                                                  const std::string&             home_team,
                                                                  const std::string&             away_team);

// normalized_fields for a snapshot of game_id built from its raw payloads.
google::protobuf::Struct NormalizeFields(const std::string& game_id, const google::protobuf::Struct& raw_payloads);

model::Snapshot            ParseCollectorPayload(const std::string& json, const std::string& schema_version);
model::Outcome             ParseOutcomePayload(const std::string& json);
model::ImprovementProposal ParseProposalPayload(const std::string& json);

} // namespace sportsledger::ingest
