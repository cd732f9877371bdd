#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/delta/snapshot_delta.hpp"
#include "internal/model/records.hpp"
#include "service_context.hpp"

namespace sportsledger::service {

struct SnapshotDiff {
  std::string            game_id;
  std::string            older_id;
  std::string            newer_id;
  double                 time_delta_seconds = 0.0;
  std::vector<delta::FieldDiff> changes;
};

/*
  Snapshot side of the ledger: records what the collector delivered and
  answers timeline questions about it.
*/
class CollectionService {
 public:
  explicit CollectionService(ServiceContext ctx);

  // Normalizes a collector document and stores it as a Snapshot.
  model::Snapshot Collect(const std::string& payload_json);

  model::Snapshot Record(model::Snapshot snapshot);

  std::vector<model::Snapshot> Timeline(const std::string& game_id, std::optional<util::TimePoint> as_of = std::nullopt);

  // Field changes from older to newer; unchanged fields only on request.
  SnapshotDiff Diff(const std::string& older_id, const std::string& newer_id, bool include_unchanged = false);

 private:
  ServiceContext ctx_;
};

} // namespace sportsledger::service
