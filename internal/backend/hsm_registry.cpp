#include "hsm_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace hsm::backend {

HsmKind ParseHsmKind(std::string_view value) {
  if (value.empty() || value == "none") {
    return HsmKind::kNone;
  }
  if (value == "filesystem") {
    return HsmKind::kFilesystem;
  }
  throw std::invalid_argument("unknown HSM backend kind: " + std::string(value));
}

HsmRegistry::HsmRegistry(std::vector<BackendEntry> entries, PoolFactory pool_factory)
    : entries_(std::move(entries)), pool_factory_(std::move(pool_factory)) {
}

std::vector<BackendEntry> HsmRegistry::EntriesFromConfig(const hsm::runtime::config::HsmConfig& config) {
  std::vector<BackendEntry> entries;
  entries.reserve(config.backends_size());
  for (const auto& backend : config.backends()) {
    if (backend.storage_box().empty()) {
      throw std::invalid_argument("hsm.backends entry without storage_box");
    }
    BackendEntry entry;
    entry.storage_box = backend.storage_box();
    entry.checker     = ParseHsmKind(backend.checker());
    entry.retriever   = ParseHsmKind(backend.retriever());
    entries.push_back(std::move(entry));
  }
  return entries;
}

const BackendEntry* HsmRegistry::Find(const std::string& storage_box) const {
  const BackendEntry* found   = nullptr;
  std::size_t         matches = 0;
  for (const auto& entry : entries_) {
    if (entry.storage_box != storage_box) continue;
    found = &entry;
    ++matches;
  }

  if (matches > 1) {
    throw util::MultipleConfigError("storage box " + storage_box + " has " + std::to_string(matches) + " HSM backend configs");
  }
  return found;
}

std::shared_ptr<PoolHsm> HsmRegistry::PoolBacked() {
  std::lock_guard lock(pool_mutex_);
  if (!pool_) {
    if (!pool_factory_) {
      throw util::InvalidState("filesystem HSM backend requested but no worker pool is available");
    }
    pool_ = pool_factory_();
  }
  return pool_;
}

HsmCheckerPtr HsmRegistry::CheckerFor(const std::string& storage_box) {
  const auto* entry = Find(storage_box);
  if (!entry || entry->checker == HsmKind::kNone) {
    return null_;
  }
  return PoolBacked();
}

HsmRetrieverPtr HsmRegistry::RetrieverFor(const std::string& storage_box) {
  const auto* entry = Find(storage_box);
  if (!entry || entry->retriever == HsmKind::kNone) {
    return null_;
  }
  return PoolBacked();
}

} // namespace hsm::backend
