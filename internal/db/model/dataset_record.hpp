#pragma once

#include <string>
#include <vector>

namespace hsm::db::model {

/*
  Dataset grouping. A dataset may belong to several experiments.
*/

struct DatasetRecord {
  std::string id;
  std::vector<std::string> experiment_ids;
};

} // namespace hsm::db::model
