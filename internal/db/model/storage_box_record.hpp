#pragma once

#include <string>

namespace hsm::db::model {

/*
  Storage location that holds file replicas.

  storage_class is the fully qualified backend identifier used to decide
  whether the box supports online/offline probing. location is the root
  path that replica URIs are resolved against.
*/

struct StorageBoxRecord {
  std::string name;
  std::string storage_class;
  std::string location;
};

} // namespace hsm::db::model
