#include "analysis_service.hpp"

#include "internal/comparison/comparison_engine.hpp"
#include "internal/lineage/lineage_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/immutable_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace sportsledger::service {

using observability::BoolField;
using observability::StringField;

AnalysisService::AnalysisService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::optional<model::Analysis> AnalysisService::AnalyzeGame(const std::string&                game_id,
                                                            const std::optional<std::string>& parent_analysis_id,
                                                            std::optional<util::TimePoint>    as_of) {
  const auto snapshots = ctx_.store->ListByGame(game_id, as_of);
  if (snapshots.empty()) {
    throw util::NotFoundError("game", game_id);
  }

  auto analysis = comparison::Analyze(snapshots, ctx_.comparison, parent_analysis_id);
  if (!analysis) {
    SPORTSLEDGER_LOG_INFO("Nothing to analyze", {StringField("game_id", game_id)});
    return std::nullopt;
  }

  auto stored = ctx_.store->Insert(std::move(*analysis));
  SPORTSLEDGER_LOG_INFO("Analysis stored",
                        {StringField("game_id", game_id), StringField("analysis_id", stored.analysis_id),
                         BoolField("edge_flagged", util::GetBool(stored.conclusions, "edge_flagged").value_or(false))});
  return stored;
}

BatchReport AnalysisService::AnalyzeAll() {
  BatchRunner runner(ctx_.batch_workers);
  return runner.Run("analyze_all", ctx_.store->ListGames(), [this](const std::string& game_id) {
    return AnalyzeGame(game_id) ? UnitStatus::kDone : UnitStatus::kSkipped;
  });
}

std::vector<model::Analysis> AnalysisService::Lineage(const std::string& analysis_id) {
  return ctx_.store->ListLineagePath(analysis_id);
}

std::vector<model::Analysis> AnalysisService::Children(const std::string& analysis_id) {
  return ctx_.store->ListChildren(analysis_id);
}

std::vector<std::string> AnalysisService::Descendants(const std::string& analysis_id, std::size_t max_depth) {
  std::vector<lineage::LineageNode> pending;
  for (const auto& analysis : ctx_.store->ListAnalyses()) {
    pending.push_back({analysis.analysis_id, analysis.parent_analysis_id, analysis.created_at});
  }

  // equal creation stamps may list a child ahead of its parent
  lineage::LineageGraph graph;
  while (!pending.empty()) {
    std::vector<lineage::LineageNode> deferred;
    for (auto& node : pending) {
      if (node.parent_id && !graph.Contains(*node.parent_id)) {
        deferred.push_back(std::move(node));
      } else {
        graph.Add(node);
      }
    }
    if (deferred.size() == pending.size()) {
      throw util::IntegrityError("analysis " + deferred.front().id + " names a parent that is not stored");
    }
    pending = std::move(deferred);
  }
  return graph.Descendants(analysis_id, max_depth);
}

} // namespace sportsledger::service
