#include "status_creator.hpp"

#include <stdexcept>

#include "internal/lock/advisory_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace hsm::status {

using observability::BoolField;
using observability::StringField;
using observability::UIntField;

const char* CreateStatusOutcomeName(CreateStatusOutcome outcome) {
  switch (outcome) {
    case CreateStatusOutcome::kCreated:
      return "created";
    case CreateStatusOutcome::kAlreadyExists:
      return "already_exists";
    case CreateStatusOutcome::kLockNotAcquired:
      return "lock_not_acquired";
    case CreateStatusOutcome::kUnverified:
      return "unverified";
    case CreateStatusOutcome::kFileNotFound:
      return "file_not_found";
  }
  return "unknown";
}

StatusCreator::StatusCreator(std::shared_ptr<db::Repository> repository, std::shared_ptr<StatusStore> store, std::shared_ptr<OnlineStatus> online,
                             cache::KeyValueCachePtr lock_cache, LockSettings locks)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      online_(std::move(online)),
      lock_cache_(std::move(lock_cache)),
      locks_(locks) {
  if (!repository_ || !store_ || !online_ || !lock_cache_) {
    throw std::invalid_argument("StatusCreator requires repository, status store, online status and lock cache");
  }
}

CreateStatusResult StatusCreator::CreateStatus(const std::string& file_id, const std::string& namespace_uri) {
  store_->RequireNamespace(namespace_uri);

  std::optional<db::model::TrackedFileRecord> file;
  {
    auto tx = repository_->Begin();
    file    = repository_->GetFile(*tx, file_id);
    tx->Commit();
  }

  if (!file.has_value()) {
    HSM_LOG_WARN("Cannot create status for unknown file", {StringField("file_id", file_id)});
    return {CreateStatusOutcome::kFileNotFound, std::nullopt};
  }
  if (!file->verified) {
    HSM_LOG_WARN("Cannot determine online/offline status, file is not verified", {StringField("file_id", file_id)});
    return {CreateStatusOutcome::kUnverified, std::nullopt};
  }

  if (store_->Exists(file_id, namespace_uri)) {
    return {CreateStatusOutcome::kAlreadyExists, std::nullopt};
  }

  lock::AdvisoryLock lock(lock_cache_, lock::AdvisoryLock::KeyFor(file_id), util::GenerateOwnerId("status"), locks_.ttl, locks_.safety_margin);
  if (!lock.Acquire()) {
    HSM_LOG_DEBUG("Status creation already in progress elsewhere", {StringField("file_id", file_id)});
    return {CreateStatusOutcome::kLockNotAcquired, std::nullopt};
  }

  if (store_->Exists(file_id, namespace_uri)) {
    return {CreateStatusOutcome::kAlreadyExists, std::nullopt};
  }

  ResolvedFile resolved;
  try {
    resolved = online_->Resolve(file_id);
  } catch (const util::Unverified& e) {
    HSM_LOG_WARN("Cannot determine online/offline status, replica is not verified",
                 {StringField("file_id", file_id), StringField("error", e.what())});
    return {CreateStatusOutcome::kUnverified, std::nullopt};
  }
  const bool online = online_->Dispatch(resolved).get().GetOrThrow();

  if (!store_->Create(file_id, namespace_uri, online)) {
    return {CreateStatusOutcome::kAlreadyExists, std::nullopt};
  }

  HSM_LOG_INFO("Status record created", {StringField("file_id", file_id), BoolField("online", online)});
  return {CreateStatusOutcome::kCreated, online};
}

BackfillReport StatusCreator::Backfill(const std::string& namespace_uri) {
  store_->RequireNamespace(namespace_uri);

  std::vector<db::model::TrackedFileRecord> files;
  {
    auto tx = repository_->Begin();
    files   = repository_->ListFiles(*tx);
    tx->Commit();
  }

  BackfillReport report;
  for (const auto& file : files) {
    if (!file.verified) continue;

    try {
      switch (CreateStatus(file.id, namespace_uri).outcome) {
        case CreateStatusOutcome::kCreated:
          ++report.created;
          break;
        case CreateStatusOutcome::kAlreadyExists:
          ++report.already_exists;
          break;
        case CreateStatusOutcome::kLockNotAcquired:
          ++report.lock_not_acquired;
          break;
        case CreateStatusOutcome::kUnverified:
        case CreateStatusOutcome::kFileNotFound:
          break;
      }
    } catch (const std::exception& e) {
      ++report.failed;
      HSM_LOG_WARN("Backfill could not create status", {StringField("file_id", file.id), StringField("error", e.what())});
    }
  }

  HSM_LOG_INFO("Backfill finished", {UIntField("created", report.created), UIntField("already_exists", report.already_exists),
                                     UIntField("lock_not_acquired", report.lock_not_acquired), UIntField("failed", report.failed)});
  return report;
}

} // namespace hsm::status
