#pragma once

#include "internal/backend/hsm_backend.hpp"

namespace hsm::backend {

/*
  Backend for storage that is not HSM managed.

  Everything is online and every retrieve succeeds, immediately and on the
  calling thread, so callers never special-case "no HSM configured".
*/
class NullHsm final : public HsmChecker, public HsmRetriever {
 public:
  void Online(const StorageObject& object, OnlineCallback callback) override;

  void Retrieve(const StorageObject& object, RetrieveCallback callback) override;

  void RetrieveBatch(const std::vector<StorageObject>& objects, BatchCallback callback) override;
};

} // namespace hsm::backend
