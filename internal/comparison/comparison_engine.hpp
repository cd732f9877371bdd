#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/records.hpp"

namespace sportsledger::comparison {

struct ComparisonOptions {
  double                     edge_threshold = 0.03;
  std::string                analysis_version = "1.0.0";
  std::string                code_version     = "unknown";
  std::optional<std::string> model_version;
  double                     stake_units = 1.0;
};

/*
  Builds an unsaved Analysis comparing the prediction market against the
  no-vig sportsbook line for one game.

  snapshots must be non-empty and belong to one game; they are compared in
  collected_at order and every one of them becomes an input of the
  analysis. Snapshots without a sportsbook line contribute no comparison;
  if none has one the result is nullopt.

  The result depends only on the snapshots, options and parent: no clock,
  no randomness. analysis_id, created_at and hash are left for the store.
*/
std::optional<model::Analysis> Analyze(const std::vector<model::Snapshot>& snapshots,
                                       const ComparisonOptions&            options,
                                       const std::optional<std::string>&   parent_analysis_id = std::nullopt);

} // namespace sportsledger::comparison
