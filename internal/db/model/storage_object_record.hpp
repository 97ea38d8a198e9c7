#pragma once

#include <string>

namespace hsm::db::model {

// One replica of a tracked file inside a storage box.
struct StorageObjectRecord {
  std::string file_id;
  std::string storage_box;

  // path relative to the box location
  std::string uri;

  bool verified  = false;
  bool preferred = false;
};

} // namespace hsm::db::model
