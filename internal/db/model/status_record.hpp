#pragma once

#include <cstdint>
#include <string>

namespace hsm::db::model {

/*
  Persisted online/offline status of a tracked file.

  value is the textual boolean "True" / "False".
  (namespace_uri, file_id) is unique.
*/

struct StatusRecord {
  std::string namespace_uri;
  std::string file_id;
  std::string value;

  // last write time (epoch ms)
  uint64_t updated_at_ms = 0;
};

} // namespace hsm::db::model
