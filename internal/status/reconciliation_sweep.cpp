#include "reconciliation_sweep.hpp"

#include <future>
#include <stdexcept>
#include <vector>

#include "internal/lock/advisory_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace hsm::status {

using observability::StringField;
using observability::UIntField;

namespace {

struct PendingCheck {
  std::string                         file_id;
  std::unique_ptr<lock::AdvisoryLock> lock;
  std::future<util::Outcome<bool>>    result;
};

} // namespace

ReconciliationSweep::ReconciliationSweep(std::shared_ptr<StatusStore> store, std::shared_ptr<OnlineStatus> online,
                                         cache::KeyValueCachePtr lock_cache, LockSettings locks, std::size_t batch_size)
    : store_(std::move(store)),
      online_(std::move(online)),
      lock_cache_(std::move(lock_cache)),
      locks_(locks),
      batch_size_(batch_size == 0 ? kDefaultSweepBatchSize : batch_size) {
  if (!store_ || !online_ || !lock_cache_) {
    throw std::invalid_argument("ReconciliationSweep requires status store, online status and lock cache");
  }
}

SweepReport ReconciliationSweep::Run(const std::string& namespace_uri) {
  store_->RequireNamespace(namespace_uri);

  const auto  owner_id = util::GenerateOwnerId("sweep");
  SweepReport report;
  std::string after;

  for (;;) {
    auto page = store_->OnlinePage(namespace_uri, after, batch_size_);
    if (page.empty()) break;
    after = page.back().file_id;
    report.candidates += page.size();

    // ------------------------------------------------------------------
    // Dispatch
    // ------------------------------------------------------------------
    std::vector<PendingCheck> pending;
    pending.reserve(page.size());

    for (const auto& record : page) {
      const auto& file_id = record.file_id;
      try {
        auto resolved = online_->Resolve(file_id);

        auto lock = std::make_unique<lock::AdvisoryLock>(lock_cache_, lock::AdvisoryLock::KeyFor(file_id), owner_id, locks_.ttl, locks_.safety_margin);
        if (!lock->Acquire()) {
          ++report.skipped_locked;
          continue;
        }

        pending.push_back({file_id, std::move(lock), online_->Dispatch(resolved)});
      } catch (const util::StorageClassNotSupportedError& e) {
        ++report.skipped;
        HSM_LOG_ERROR("Sweep skipped file on unsupported storage class", {StringField("file_id", file_id), StringField("error", e.what())});
      } catch (const util::NotFound& e) {
        ++report.skipped;
        HSM_LOG_WARN("Sweep skipped status record without file", {StringField("file_id", file_id), StringField("error", e.what())});
      } catch (const util::Unverified&) {
        ++report.skipped;
        HSM_LOG_DEBUG("Sweep skipped unverified file", {StringField("file_id", file_id)});
      } catch (const util::MissingLocationError& e) {
        ++report.skipped;
        HSM_LOG_WARN("Sweep skipped file without location", {StringField("file_id", file_id), StringField("error", e.what())});
      } catch (const util::MultipleConfigError& e) {
        ++report.skipped;
        HSM_LOG_ERROR("Sweep skipped file with ambiguous HSM config", {StringField("file_id", file_id), StringField("error", e.what())});
      } catch (const std::exception& e) {
        ++report.failed;
        HSM_LOG_ERROR("Sweep could not dispatch check", {StringField("file_id", file_id), StringField("error", e.what())});
      }
    }

    // ------------------------------------------------------------------
    // Collect
    // ------------------------------------------------------------------
    for (auto& check : pending) {
      auto outcome = check.result.get();
      if (outcome.IsFailure()) {
        ++report.failed;
        HSM_LOG_WARN("Online check failed", {StringField("file_id", check.file_id), StringField("error", outcome.ErrorMessage())});
        continue;
      }

      if (outcome.GetOrThrow()) {
        ++report.unchanged;
        continue;
      }

      try {
        if (store_->MarkOffline(check.file_id, namespace_uri)) {
          ++report.flipped_offline;
          HSM_LOG_INFO("File went offline", {StringField("file_id", check.file_id)});
        } else {
          ++report.unchanged;
        }
      } catch (const std::exception& e) {
        ++report.failed;
        HSM_LOG_ERROR("Could not persist offline status", {StringField("file_id", check.file_id), StringField("error", e.what())});
      }
    }

    if (page.size() < batch_size_) break;
  }

  HSM_LOG_INFO("Sweep finished", {StringField("namespace", namespace_uri), UIntField("candidates", report.candidates),
                                  UIntField("unchanged", report.unchanged), UIntField("flipped_offline", report.flipped_offline),
                                  UIntField("skipped", report.skipped), UIntField("skipped_locked", report.skipped_locked),
                                  UIntField("failed", report.failed)});
  return report;
}

} // namespace hsm::status
