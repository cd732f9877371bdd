#include "outcome_service.hpp"

#include "internal/ingest/payload_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/immutable_store.hpp"
#include "internal/util/errors.hpp"

namespace sportsledger::service {

using observability::IntField;
using observability::StringField;

OutcomeService::OutcomeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::Outcome OutcomeService::Ingest(const std::string& payload_json) {
  return Record(ingest::ParseOutcomePayload(payload_json));
}

model::Outcome OutcomeService::Record(model::Outcome outcome) {
  auto stored = ctx_.store->Insert(std::move(outcome));
  SPORTSLEDGER_LOG_INFO("Outcome recorded", {StringField("game_id", stored.game_id), StringField("outcome_id", stored.outcome_id),
                                             IntField("revision", stored.revision)});
  return stored;
}

model::Outcome OutcomeService::Correct(model::Outcome outcome) {
  auto current = ctx_.store->CurrentOutcome(outcome.game_id);
  if (!current) {
    throw util::NotFoundError("outcome", outcome.game_id);
  }
  outcome.outcome_id.clear();
  outcome.hash.clear();
  outcome.revision              = current->revision + 1;
  outcome.supersedes_outcome_id = current->outcome_id;
  return Record(std::move(outcome));
}

std::optional<model::Outcome> OutcomeService::Current(const std::string& game_id) {
  return ctx_.store->CurrentOutcome(game_id);
}

std::vector<std::string> OutcomeService::PendingGames() {
  std::vector<std::string> pending;
  for (const auto& game_id : ctx_.store->ListGames()) {
    if (!ctx_.store->CurrentOutcome(game_id)) {
      pending.push_back(game_id);
    }
  }
  return pending;
}

} // namespace sportsledger::service
