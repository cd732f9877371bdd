#include "internal/integrity/integrity_verifier.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

#include "internal/model/record_hash.hpp"
#include "internal/observability/logging.hpp"

namespace sportsledger::integrity {
namespace {

using observability::IntField;
using observability::StringField;

// Loads one row by id. Returns nullopt and records a mismatch when the row
// no longer decodes or has vanished between the key listing and the read.
template <typename Load>
auto LoadRow(const db::RecordKey& key, model::EntityType entity, Load load, VerificationReport& report)
    -> decltype(load(key.id)) {
  std::string failure;
  try {
    auto record = load(key.id);
    if (record) {
      return record;
    }
    failure = "<missing>";
  } catch (const std::exception& e) {
    failure = std::string("<undecodable: ") + e.what() + ">";
  }
  SPORTSLEDGER_LOG_ERROR("Unreadable record", {StringField("entity", model::EntityName(entity)), StringField("id", key.id),
                                               StringField("error", failure)});
  report.mismatches.push_back(Mismatch{entity, key.id, key.hash, std::move(failure)});
  return std::nullopt;
}

template <typename Load>
void Check(db::Repository& repository, db::Transaction& tx, model::EntityType entity, Load load,
           VerificationReport& report) {
  auto keys = repository.ListRecordKeys(tx, entity);
  report.checked[entity] += keys.size();
  for (const auto& key : keys) {
    auto record = LoadRow(key, entity, load, report);
    if (!record) {
      continue;
    }
    auto actual = model::ComputeHash(*record);
    if (actual == key.hash) {
      continue;
    }
    SPORTSLEDGER_LOG_ERROR("Hash mismatch", {StringField("entity", model::EntityName(entity)), StringField("id", key.id),
                                             StringField("expected", key.hash), StringField("actual", actual)});
    report.mismatches.push_back(Mismatch{entity, key.id, key.hash, std::move(actual)});
  }
}

} // namespace

std::size_t VerificationReport::total_checked() const {
  std::size_t total = 0;
  for (const auto& [entity, count] : checked) {
    total += count;
  }
  return total;
}

IntegrityVerifier::IntegrityVerifier(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("integrity verifier requires a repository");
  }
}

VerificationReport IntegrityVerifier::Run() const {
  VerificationReport report;
  auto               tx = repository_->Begin();

  auto& repo = *repository_;
  Check(repo, *tx, model::EntityType::kSnapshot, [&](const std::string& id) { return repo.GetSnapshot(*tx, id); },
        report);
  Check(repo, *tx, model::EntityType::kAnalysis, [&](const std::string& id) { return repo.GetAnalysis(*tx, id); },
        report);
  Check(repo, *tx, model::EntityType::kOutcome, [&](const std::string& id) { return repo.GetOutcome(*tx, id); },
        report);
  Check(repo, *tx, model::EntityType::kEvaluation, [&](const std::string& id) { return repo.GetEvaluation(*tx, id); },
        report);
  Check(repo, *tx, model::EntityType::kProposal, [&](const std::string& id) { return repo.GetProposal(*tx, id); },
        report);

  // nothing to keep
  tx->Rollback();

  SPORTSLEDGER_LOG_INFO("Integrity verification finished",
                        {IntField("checked", static_cast<std::int64_t>(report.total_checked())),
                         IntField("mismatches", static_cast<std::int64_t>(report.mismatches.size()))});
  return report;
}

} // namespace sportsledger::integrity
