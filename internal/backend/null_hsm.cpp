#include "null_hsm.hpp"

namespace hsm::backend {

void NullHsm::Online(const StorageObject&, OnlineCallback callback) {
  callback(util::Outcome<bool>::Success(true));
}

void NullHsm::Retrieve(const StorageObject&, RetrieveCallback callback) {
  callback(util::Outcome<bool>::Success(true));
}

void NullHsm::RetrieveBatch(const std::vector<StorageObject>& objects, BatchCallback callback) {
  std::vector<RetrieveEntry> entries;
  entries.reserve(objects.size());
  for (const auto& object : objects) {
    entries.push_back({object.file_id, util::Outcome<bool>::Success(true)});
  }
  callback(std::move(entries));
}

} // namespace hsm::backend
