#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/backend/hsm_registry.hpp"
#include "internal/cache/kv_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/hsm_status_service.hpp"
#include "internal/status/online_status.hpp"
#include "internal/status/reconciliation_sweep.hpp"
#include "internal/status/status_creator.hpp"
#include "internal/status/status_store.hpp"

#if HSM_STATUS_ENABLE_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace hsm::factory {

/*
  Application

  Owns all long-lived singletons used by the daemon and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  cache::KeyValueCachePtr               lock_cache;
  std::shared_ptr<backend::HsmRegistry> registry;

  std::shared_ptr<status::StatusStore>         store;
  std::shared_ptr<status::OnlineStatus>        online;
  std::shared_ptr<status::StatusCreator>       creator;
  std::shared_ptr<status::ReconciliationSweep> sweep;

  std::shared_ptr<service::HsmStatusService> status_service;

  std::string datafile_namespace;

#if HSM_STATUS_ENABLE_GRPC
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Build

  Constructs the entire backend based on runtime config. Expects a config
  that went through config::ApplyDefaults.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, cache and HSM types.
*/
Application Build(const hsm::runtime::config::RuntimeConfig& config);

// Same, over a caller-supplied repository (tests, embedding).
Application Build(const hsm::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace hsm::factory
