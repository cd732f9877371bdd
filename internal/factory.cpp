#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if SPORTSLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace sportsledger::factory {

namespace {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const sportsledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SPORTSLEDGER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    SPORTSLEDGER_LOG_INFO("Opened ledger", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  SPORTSLEDGER_LOG_INFO("Opened ledger", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

service::ServiceContext MakeServiceContext(const sportsledger::runtime::config::RuntimeConfig& config) {
  service::ServiceContext ctx;

  const auto& analysis              = config.analysis();
  ctx.comparison.edge_threshold     = analysis.edge_threshold();
  ctx.comparison.analysis_version   = analysis.analysis_version();
  ctx.comparison.code_version       = analysis.code_version();
  ctx.comparison.stake_units        = analysis.stake_units();
  if (!analysis.model_version().empty()) {
    ctx.comparison.model_version = analysis.model_version();
  }
  ctx.schema_version = analysis.schema_version();

  ctx.scoring.log_loss_epsilon = config.scoring().log_loss_epsilon();
  ctx.batch_workers            = config.batch().workers();
  return ctx;
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const sportsledger::runtime::config::RuntimeConfig& config) {
  const auto resolved = sportsledger::config::ConfigLoader::WithDefaults(config);
  return BuildRuntime(resolved, BuildRepository(resolved));
}

RuntimeDependencies BuildRuntime(const sportsledger::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository>                     repository) {
  if (!repository) {
    throw std::invalid_argument("runtime requires a repository");
  }
  const auto resolved = sportsledger::config::ConfigLoader::WithDefaults(config);

  RuntimeDependencies deps;
  deps.repository = std::move(repository);
  deps.store      = std::make_shared<store::ImmutableStore>(deps.repository);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto ctx       = MakeServiceContext(resolved);
  ctx.store      = deps.store;
  ctx.repository = deps.repository;

  deps.collection = std::make_shared<service::CollectionService>(ctx);
  deps.outcomes   = std::make_shared<service::OutcomeService>(ctx);
  deps.analysis   = std::make_shared<service::AnalysisService>(ctx);
  deps.evaluation = std::make_shared<service::EvaluationService>(ctx);
  deps.proposals  = std::make_shared<service::ProposalService>(ctx);

  deps.verifier = std::make_shared<integrity::IntegrityVerifier>(deps.repository);
  return deps;
}

} // namespace sportsledger::factory
