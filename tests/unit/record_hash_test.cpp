#include "internal/model/record_hash.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace sportsledger;

model::Snapshot MakeSnapshot() {
  model::Snapshot snapshot;
  snapshot.game_id                     = "game-1";
  snapshot.collected_at                = util::ParseTimestamp("2024-01-15T19:30:00Z");
  snapshot.schema_version              = "1.0.0";
  snapshot.source_versions["odds_api"] = "v4";
  snapshot.raw_payloads                = util::ParseStruct(R"({"odds_api": {"id": "game-1"}})");
  snapshot.normalized_fields           = util::ParseStruct(R"({"sportsbook": {"best_home_odds": -150}})");
  return snapshot;
}

model::ImprovementProposal MakeProposal() {
  model::ImprovementProposal proposal;
  proposal.created_at              = util::ParseTimestamp("2024-02-01T00:00:00Z");
  proposal.based_on_evaluation_ids = {"eval-1"};
  proposal.proposal_text           = "Track injury reports";
  proposal.expected_impact         = "better calibration";
  return proposal;
}

void TestIdAndHashDoNotAffectHash() {
  auto a = MakeSnapshot();
  auto b = MakeSnapshot();
  b.snapshot_id = "some-id";
  b.hash        = "deadbeef";
  assert(model::ComputeHash(a) == model::ComputeHash(b));
  assert(model::ComputeHash(a).size() == 64);
}

void TestContentChangesHash() {
  auto a = MakeSnapshot();
  auto b = MakeSnapshot();
  b.collected_at += std::chrono::seconds(1);
  assert(model::ComputeHash(a) != model::ComputeHash(b));

  auto c = MakeSnapshot();
  c.source_versions["kalshi"] = "v2";
  assert(model::ComputeHash(a) != model::ComputeHash(c));
}

void TestCreationStampIsExcluded() {
  auto a = MakeProposal();
  auto b = MakeProposal();
  b.created_at = util::ParseTimestamp("2025-06-01T12:00:00Z");
  assert(model::ComputeHash(a) == model::ComputeHash(b));
}

void TestProposalStatusIsHashed() {
  auto a = MakeProposal();
  auto b = MakeProposal();
  b.status = model::ProposalStatus::kAccepted;
  assert(model::ComputeHash(a) != model::ComputeHash(b));
}

void TestOutcomeRevisionIsHashed() {
  model::Outcome first;
  first.game_id          = "game-1";
  first.occurred_at      = util::ParseTimestamp("2024-01-16T03:00:00Z");
  first.final_score.home = 110;
  first.final_score.away = 102;
  first.winner           = "Los Angeles Lakers";
  first.source           = "manual";

  auto second                  = first;
  second.revision              = 2;
  second.supersedes_outcome_id = "outcome-1";
  assert(model::ComputeHash(first) != model::ComputeHash(second));

  auto tie   = first;
  tie.winner = std::nullopt;
  assert(model::ComputeHash(first) != model::ComputeHash(tie));
}

} // namespace

int main() {
  TestIdAndHashDoNotAffectHash();
  TestContentChangesHash();
  TestCreationStampIsExcluded();
  TestProposalStatusIsHashed();
  TestOutcomeRevisionIsHashed();

  std::cout << "sportsledger_unit_record_hash: pass\n";
  return 0;
}
