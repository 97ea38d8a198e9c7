#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/outcome.hpp"

namespace hsm::backend {

/*
  The storage object backing a tracked file, as seen by an HSM backend.
*/
struct StorageObject {
  std::string file_id;
  std::string path;
  bool        verified = false;

  // Per-call override of the checker's inline-data threshold.
  std::optional<uint64_t> min_file_size_bytes;
};

using OnlineCallback   = std::function<void(util::Outcome<bool>)>;
using RetrieveCallback = std::function<void(util::Outcome<bool>)>;

struct RetrieveEntry {
  std::string          file_id;
  util::Outcome<bool>  outcome = util::Outcome<bool>::Success(false);
};

using BatchCallback = std::function<void(std::vector<RetrieveEntry>)>;

/*
  Online status checker.

  Online() must not block the caller. The callback is invoked exactly once
  with either the status or the error that prevented computing it.
  Unverified objects are rejected synchronously with util::Unverified,
  before anything is scheduled; the callback is then never invoked.
*/
class HsmChecker {
 public:
  virtual ~HsmChecker() = default;

  virtual void Online(const StorageObject& object, OnlineCallback callback) = 0;
};

/*
  Recall hook.

  Retrieve() forces a recall by reading the first byte of the object; the
  outcome is true when the read completed. RetrieveBatch() reports one
  entry per input object, in input order, through a single callback.
*/
class HsmRetriever {
 public:
  virtual ~HsmRetriever() = default;

  virtual void Retrieve(const StorageObject& object, RetrieveCallback callback) = 0;

  virtual void RetrieveBatch(const std::vector<StorageObject>& objects, BatchCallback callback) = 0;
};

using HsmCheckerPtr   = std::shared_ptr<HsmChecker>;
using HsmRetrieverPtr = std::shared_ptr<HsmRetriever>;

} // namespace hsm::backend
