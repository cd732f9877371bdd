#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/integrity/integrity_verifier.hpp"
#include "internal/service/analysis_service.hpp"
#include "internal/service/collection_service.hpp"
#include "internal/service/evaluation_service.hpp"
#include "internal/service/outcome_service.hpp"
#include "internal/service/proposal_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/immutable_store.hpp"

namespace sportsledger::factory {

/*
  RuntimeDependencies

  Owns every long-lived object of a ledger process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<store::ImmutableStore> store;

  std::shared_ptr<service::CollectionService> collection;
  std::shared_ptr<service::OutcomeService>    outcomes;
  std::shared_ptr<service::AnalysisService>   analysis;
  std::shared_ptr<service::EvaluationService> evaluation;
  std::shared_ptr<service::ProposalService>   proposals;

  std::shared_ptr<integrity::IntegrityVerifier> verifier;
};

/*
  Option structs for the pure components, read from config once here so
  nothing below the composition root sees RuntimeConfig. config must
  already carry defaults (config::ConfigLoader::WithDefaults).
*/
service::ServiceContext MakeServiceContext(const sportsledger::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. It is the ONLY place allowed to know concrete DB
  types; the SQLite schema is bootstrapped here on every open.
*/
RuntimeDependencies BuildRuntime(const sportsledger::runtime::config::RuntimeConfig& config);

// Wires services over an existing repository (tests reopen files this way).
RuntimeDependencies BuildRuntime(const sportsledger::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository>                     repository);

} // namespace sportsledger::factory
