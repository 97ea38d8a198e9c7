#pragma once

#include <string>

namespace hsm::db::model {

// Registered metadata namespace. Status records can only be written
// under a namespace that has a schema row.
struct SchemaRecord {
  std::string namespace_uri;
  std::string name;
};

} // namespace hsm::db::model
