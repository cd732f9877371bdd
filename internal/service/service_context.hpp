#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/comparison/comparison_engine.hpp"
#include "internal/scoring/scoring_engine.hpp"

namespace sportsledger::store {
class ImmutableStore;
}
namespace sportsledger::db {
class Repository;
}

namespace sportsledger::service {

/*
  Dependency container shared by all services.

  Everything a service needs is handed in here; nothing below the
  composition root reads configuration.
*/
struct ServiceContext {
  std::shared_ptr<sportsledger::store::ImmutableStore> store;
  std::shared_ptr<sportsledger::db::Repository>        repository;

  comparison::ComparisonOptions comparison;
  scoring::ScoringOptions       scoring;
  std::string                   schema_version = "1.0.0";
  std::size_t                   batch_workers  = 1;
};

} // namespace sportsledger::service
