#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/backend/hsm_backend.hpp"
#include "internal/backend/null_hsm.hpp"
#include "internal/backend/pool_hsm.hpp"

namespace hsm::backend {

enum class HsmKind {
  kNone,
  kFilesystem,
};

// "none" (or empty) | "filesystem"; throws std::invalid_argument otherwise.
HsmKind ParseHsmKind(std::string_view value);

struct BackendEntry {
  std::string storage_box;
  HsmKind     checker   = HsmKind::kNone;
  HsmKind     retriever = HsmKind::kNone;
};

/*
  Resolves the HSM implementation for a storage box.

  Lookup over the configured entries for the box:
    no entry       -> NullHsm
    one entry      -> the configured kind
    several        -> util::MultipleConfigError

  The registry is the only place that constructs backends. The pool-backed
  backend is built on first use through `pool_factory` and that one instance
  is returned for every later resolution.
*/
class HsmRegistry {
 public:
  using PoolFactory = std::function<std::shared_ptr<PoolHsm>()>;

  HsmRegistry(std::vector<BackendEntry> entries, PoolFactory pool_factory);

  static std::vector<BackendEntry> EntriesFromConfig(const hsm::runtime::config::HsmConfig& config);

  HsmCheckerPtr   CheckerFor(const std::string& storage_box);
  HsmRetrieverPtr RetrieverFor(const std::string& storage_box);

  std::shared_ptr<PoolHsm> PoolBacked();

 private:
  // nullptr when the box has no entry.
  const BackendEntry* Find(const std::string& storage_box) const;

  std::vector<BackendEntry> entries_;
  PoolFactory               pool_factory_;

  std::shared_ptr<NullHsm> null_ = std::make_shared<NullHsm>();

  std::mutex               pool_mutex_;
  std::shared_ptr<PoolHsm> pool_;
};

} // namespace hsm::backend
