#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "batch_runner.hpp"
#include "internal/model/records.hpp"
#include "service_context.hpp"

namespace sportsledger::service {

class AnalysisService {
 public:
  explicit AnalysisService(ServiceContext ctx);

  /*
    Analyzes every snapshot of the game known at as_of (all of them when
    unset) and stores the result. nullopt when no snapshot carries a
    sportsbook line. Throws util::NotFoundError for a game without
    snapshots. Re-running with the same inputs returns the stored analysis.
  */
  std::optional<model::Analysis> AnalyzeGame(const std::string&                game_id,
                                             const std::optional<std::string>& parent_analysis_id = std::nullopt,
                                             std::optional<util::TimePoint>    as_of              = std::nullopt);

  // One unit per game; games without a sportsbook line are skipped.
  BatchReport AnalyzeAll();

  // Root-first.
  std::vector<model::Analysis> Lineage(const std::string& analysis_id);

  std::vector<model::Analysis> Children(const std::string& analysis_id);

  // Breadth-first descendant ids; max_depth 0 means unlimited.
  std::vector<std::string> Descendants(const std::string& analysis_id, std::size_t max_depth = 0);

 private:
  ServiceContext ctx_;
};

} // namespace sportsledger::service
