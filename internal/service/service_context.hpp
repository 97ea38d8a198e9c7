#pragma once

#include <memory>
#include <string>

namespace hsm::db { class Repository; }
namespace hsm::status {
class StatusStore;
class OnlineStatus;
class StatusCreator;
class ReconciliationSweep;
}

namespace hsm::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<hsm::db::Repository> repository;
  std::shared_ptr<hsm::status::StatusStore> store;
  std::shared_ptr<hsm::status::OnlineStatus> online;
  std::shared_ptr<hsm::status::StatusCreator> creator;
  std::shared_ptr<hsm::status::ReconciliationSweep> sweep;

  // used when a request leaves namespace_uri empty
  std::string default_namespace;
};

} // namespace hsm::service
