#pragma once

#include <memory>

#include "internal/backend/hsm_backend.hpp"
#include "internal/probe/stat_probe.hpp"
#include "internal/worker/worker_pool.hpp"

namespace hsm::backend {

/*
  Filesystem HSM backend running on a worker pool.

    Online()   -> stat the object on a worker, classify, deliver the bool
    Retrieve() -> read the first byte on a worker, forcing a recall

  One instance per process: HsmRegistry constructs it once and hands the
  same instance to every storage box configured as "filesystem", so the
  process never grows more than one pool for HSM work.
*/
class PoolHsm final : public HsmChecker, public HsmRetriever {
 public:
  PoolHsm(std::shared_ptr<worker::WorkerPool> pool, probe::StatProbe probe, uint64_t min_file_size_bytes);

  void Online(const StorageObject& object, OnlineCallback callback) override;

  void Retrieve(const StorageObject& object, RetrieveCallback callback) override;

  void RetrieveBatch(const std::vector<StorageObject>& objects, BatchCallback callback) override;

 private:
  static bool ReadFirstByte(const std::string& path);

  std::shared_ptr<worker::WorkerPool> pool_;
  probe::StatProbe                    probe_;
  uint64_t                            min_file_size_bytes_;
};

} // namespace hsm::backend
