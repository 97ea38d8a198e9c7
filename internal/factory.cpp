#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/backend/pool_hsm.hpp"
#include "internal/cache/memory_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/stat_probe.hpp"
#include "internal/worker/worker_pool.hpp"
#if HSM_STATUS_ENABLE_GRPC
#include "internal/grpc/hsm_status_server.hpp"
#endif
#if HSM_DB_SQLITE
#include "internal/db/sqlite/sqlite_cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace hsm::factory {

using hsm::observability::StringField;
using hsm::observability::UIntField;

namespace {

constexpr const char* kDatafileSchemaName = "Datafile HSM Schema";

std::shared_ptr<db::Repository> BuildRepository(const hsm::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if HSM_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
  "memory"   -> per-process cache
  "database" -> hsm_cache table on its own connection to the status
                database, shared with every other process using it
*/
cache::KeyValueCachePtr BuildLockCache(const hsm::runtime::config::RuntimeConfig& config) {
  const auto& kind = config.locks().cache();
  if (kind.empty() || kind == "memory") {
    return std::make_shared<cache::MemoryCache>();
  }

  if (kind == "database") {
    if (!config.database().has_sqlite()) {
      throw std::invalid_argument("locks.cache=database requires database.sqlite");
    }
#if HSM_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.database().sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteCache>(std::move(sqlite_db));
#else
    throw std::runtime_error("database lock cache requested but sqlite was not enabled at build time");
#endif
  }

  throw std::invalid_argument("unknown locks.cache: " + kind);
}

backend::HsmRegistry::PoolFactory BuildPoolFactory(const hsm::runtime::config::HsmConfig& hsm_config) {
  probe::StatProbeOptions options;
  options.strategy     = probe::ParseProbeStrategy(hsm_config.probe_strategy());
  options.stat_program = hsm_config.stat_program();

  const auto threads   = static_cast<std::size_t>(hsm_config.worker_threads());
  const auto threshold = hsm_config.min_file_size_bytes();

  return [options, threads, threshold] {
    auto pool = std::make_shared<worker::WorkerPool>(threads);
    HSM_LOG_INFO("HSM worker pool started", {UIntField("threads", pool->ThreadCount()), UIntField("min_file_size_bytes", threshold)});
    return std::make_shared<backend::PoolHsm>(std::move(pool), probe::StatProbe(options), threshold);
  };
}

} // namespace

Application Build(const hsm::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

/*
    Build full application dependency graph
*/
Application Build(const hsm::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  if (!repository) throw std::invalid_argument("Build requires a repository");

  Application app;
  app.repository         = std::move(repository);
  app.datafile_namespace = config.status().datafile_namespace();

  // ------------------------------------------------------------------
  // Locks and HSM backends
  // ------------------------------------------------------------------
  app.lock_cache = BuildLockCache(config);
  app.registry   = std::make_shared<backend::HsmRegistry>(backend::HsmRegistry::EntriesFromConfig(config.hsm()), BuildPoolFactory(config.hsm()));

  // ------------------------------------------------------------------
  // Status core
  // ------------------------------------------------------------------
  app.store = std::make_shared<status::StatusStore>(app.repository);
  if (app.store->EnsureNamespace(app.datafile_namespace, kDatafileSchemaName)) {
    HSM_LOG_INFO("Registered status namespace", {StringField("namespace", app.datafile_namespace)});
  }

  std::vector<std::string> storage_classes(config.hsm().storage_classes().begin(), config.hsm().storage_classes().end());
  app.online = std::make_shared<status::OnlineStatus>(app.repository, app.registry, std::move(storage_classes));

  status::LockSettings locks{std::chrono::seconds(config.locks().ttl_seconds()), std::chrono::seconds(config.locks().safety_margin_seconds())};
  app.creator = std::make_shared<status::StatusCreator>(app.repository, app.store, app.online, app.lock_cache, locks);
  app.sweep   = std::make_shared<status::ReconciliationSweep>(app.store, app.online, app.lock_cache, locks, config.sweep().batch_size());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository        = app.repository;
  ctx.store             = app.store;
  ctx.online            = app.online;
  ctx.creator           = app.creator;
  ctx.sweep             = app.sweep;
  ctx.default_namespace = app.datafile_namespace;

  app.status_service = std::make_shared<service::HsmStatusService>(std::move(ctx));

#if HSM_STATUS_ENABLE_GRPC
  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_shared<grpc::HsmStatusServer>(app.status_service));
#endif

  return app;
}

} // namespace hsm::factory
