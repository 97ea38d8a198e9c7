#pragma once

#include <string>

namespace hsm::db::model {

/*
  Catalogue row for a tracked data file.

  verified is the checksum verification flag. Only verified files are
  eligible for status records.
*/

struct TrackedFileRecord {
  std::string id;

  // owning dataset (empty = none)
  std::string dataset_id;

  std::string filename;

  bool verified = false;
};

} // namespace hsm::db::model
