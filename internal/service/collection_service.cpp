#include "collection_service.hpp"

#include "internal/ingest/payload_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/immutable_store.hpp"

namespace sportsledger::service {

using observability::IntField;
using observability::StringField;

CollectionService::CollectionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::Snapshot CollectionService::Collect(const std::string& payload_json) {
  return Record(ingest::ParseCollectorPayload(payload_json, ctx_.schema_version));
}

model::Snapshot CollectionService::Record(model::Snapshot snapshot) {
  if (snapshot.schema_version.empty()) {
    snapshot.schema_version = ctx_.schema_version;
  }
  auto stored = ctx_.store->Insert(std::move(snapshot));
  SPORTSLEDGER_LOG_INFO("Snapshot collected", {StringField("game_id", stored.game_id), StringField("snapshot_id", stored.snapshot_id),
                                               IntField("providers", static_cast<int64_t>(stored.source_versions.size()))});
  return stored;
}

std::vector<model::Snapshot> CollectionService::Timeline(const std::string& game_id, std::optional<util::TimePoint> as_of) {
  return ctx_.store->ListByGame(game_id, as_of);
}

SnapshotDiff CollectionService::Diff(const std::string& older_id, const std::string& newer_id, bool include_unchanged) {
  const auto older = ctx_.store->GetSnapshot(older_id);
  const auto newer = ctx_.store->GetSnapshot(newer_id);

  delta::SnapshotDelta view(older, newer);

  SnapshotDiff diff;
  diff.game_id            = view.game_id();
  diff.older_id           = older.snapshot_id;
  diff.newer_id           = newer.snapshot_id;
  diff.time_delta_seconds = view.time_delta_seconds();
  if (include_unchanged) {
    diff.changes.assign(view.begin(), view.end());
  } else {
    diff.changes = view.ChangedOnly();
  }
  return diff;
}

} // namespace sportsledger::service
