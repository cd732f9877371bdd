#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/records.hpp"
#include "service_context.hpp"

namespace sportsledger::service {

/*
  Ground truth ingestion. A game gets one outcome; a later correction is a
  new revision that supersedes the current one.
*/
class OutcomeService {
 public:
  explicit OutcomeService(ServiceContext ctx);

  model::Outcome Ingest(const std::string& payload_json);

  model::Outcome Record(model::Outcome outcome);

  // Stores outcome as the next revision of the game's current outcome.
  model::Outcome Correct(model::Outcome outcome);

  std::optional<model::Outcome> Current(const std::string& game_id);

  // Games with snapshots but no outcome yet.
  std::vector<std::string> PendingGames();

 private:
  ServiceContext ctx_;
};

} // namespace sportsledger::service
