#include "advisory_lock.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace hsm::lock {

using hsm::observability::StringField;

AdvisoryLock::AdvisoryLock(cache::KeyValueCachePtr cache, std::string key, std::string owner_id, std::chrono::seconds ttl,
                           std::chrono::seconds safety_margin)
    : cache_(std::move(cache)), key_(std::move(key)), owner_id_(std::move(owner_id)), ttl_(ttl), safety_margin_(safety_margin) {
  if (!cache_) {
    throw std::invalid_argument("advisory lock requires a cache");
  }
  if (ttl_.count() <= 0) {
    throw std::invalid_argument("advisory lock ttl must be positive");
  }
}

AdvisoryLock::~AdvisoryLock() {
  if (!held_) {
    return;
  }
  try {
    Release();
  } catch (const std::exception& e) {
    HSM_LOG_WARN("Advisory lock release failed", {StringField("key", key_), StringField("error", e.what())});
  }
}

std::string AdvisoryLock::KeyFor(const std::string& file_id) {
  return "lock-" + file_id;
}

bool AdvisoryLock::Acquire() {
  if (held_) {
    return true;
  }

  const auto now = util::SteadyNow();
  if (!cache_->Add(key_, owner_id_, ttl_)) {
    HSM_LOG_DEBUG("Advisory lock busy", {StringField("key", key_), StringField("owner", owner_id_)});
    return false;
  }

  held_       = true;
  expires_at_ = now + ttl_ - safety_margin_;
  return true;
}

void AdvisoryLock::Release() {
  if (!held_) {
    return;
  }
  held_ = false;

  if (util::SteadyNow() < expires_at_) {
    cache_->Delete(key_);
    return;
  }

  HSM_LOG_DEBUG("Advisory lock window elapsed, leaving token to expire", {StringField("key", key_), StringField("owner", owner_id_)});
}

} // namespace hsm::lock
