#include "internal/status/status_creator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/cache/memory_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/advisory_lock.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using hsm::status::CreateStatusOutcome;
using hsm::status::StatusCreator;
using namespace hsm::test;
using namespace std::chrono_literals;

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    SeedBox(*repo, kHsmBox, kLocalFsClass, dir.Path().string());
    SeedBox(*repo, "cloud", kS3Class, "bucket");
    store->EnsureNamespace(kNamespace, "Datafile HSM Schema");
  }

  TempDir                                             dir;
  std::shared_ptr<hsm::db::memory::MemoryRepository> repo   = std::make_shared<hsm::db::memory::MemoryRepository>();
  std::shared_ptr<hsm::cache::MemoryCache>            cache  = std::make_shared<hsm::cache::MemoryCache>();
  std::shared_ptr<hsm::status::StatusStore>           store  = std::make_shared<hsm::status::StatusStore>(repo);
  std::shared_ptr<hsm::status::OnlineStatus>          online = std::make_shared<hsm::status::OnlineStatus>(
      repo, FilesystemRegistry(), std::vector<std::string>{kLocalFsClass});
  StatusCreator creator{repo, store, online, cache, {30s, 3s}};
};

void TestCreatesOnlineAndOfflineRecords() {
  Fixture fx("creator_basic");
  WriteDenseFile(fx.dir.File("online.bin"), kLargeFileSize);
  WriteSparseFile(fx.dir.File("offline.bin"), kLargeFileSize);
  WriteSparseFile(fx.dir.File("small.bin"), 100);
  SeedFile(*fx.repo, "online", kHsmBox, "online.bin");
  SeedFile(*fx.repo, "offline", kHsmBox, "offline.bin");
  SeedFile(*fx.repo, "small", kHsmBox, "small.bin");

  auto online = fx.creator.CreateStatus("online", kNamespace);
  assert(online.Created());
  assert(online.created_value == true);

  auto offline = fx.creator.CreateStatus("offline", kNamespace);
  assert(offline.Created());
  assert(offline.created_value == false);

  assert(fx.creator.CreateStatus("small", kNamespace).created_value == true);

  assert(fx.store->Get("online", kNamespace) == true);
  assert(fx.store->Get("offline", kNamespace) == false);
  // locks are released after creation
  assert(!fx.cache->Get(hsm::lock::AdvisoryLock::KeyFor("online")).has_value());
}

void TestRepeatedCallsLeaveOneRecord() {
  Fixture fx("creator_idempotent");
  WriteSparseFile(fx.dir.File("offline.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "f1", kHsmBox, "offline.bin");

  assert(fx.creator.CreateStatus("f1", kNamespace).Created());

  // the file coming back online does not rewrite the record
  WriteDenseFile(fx.dir.File("offline.bin"), kLargeFileSize);
  auto again = fx.creator.CreateStatus("f1", kNamespace);
  assert(again.outcome == CreateStatusOutcome::kAlreadyExists);
  assert(!again.created_value.has_value());
  assert(fx.store->Get("f1", kNamespace) == false);
}

void TestConcurrentCreationWritesOnce() {
  Fixture fx("creator_concurrent");
  WriteDenseFile(fx.dir.File("f.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "f1", kHsmBox, "f.bin");

  std::atomic<int>         created{0};
  std::atomic<int>         other{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result = fx.creator.CreateStatus("f1", kNamespace);
      if (result.Created()) {
        ++created;
      } else if (result.outcome == CreateStatusOutcome::kAlreadyExists || result.outcome == CreateStatusOutcome::kLockNotAcquired) {
        ++other;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(created == 1);
  assert(other == 7);
  assert(fx.store->Get("f1", kNamespace) == true);
}

void TestBusyLockSkipsCreation() {
  Fixture fx("creator_busy");
  WriteDenseFile(fx.dir.File("f.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "f1", kHsmBox, "f.bin");

  hsm::lock::AdvisoryLock held(fx.cache, hsm::lock::AdvisoryLock::KeyFor("f1"), "another-worker", 30s, 3s);
  assert(held.Acquire());

  assert(fx.creator.CreateStatus("f1", kNamespace).outcome == CreateStatusOutcome::kLockNotAcquired);
  assert(!fx.store->Exists("f1", kNamespace));

  held.Release();
  assert(fx.creator.CreateStatus("f1", kNamespace).Created());
}

void TestIneligibleFiles() {
  Fixture fx("creator_ineligible");
  SeedFile(*fx.repo, "unverified", kHsmBox, "u.bin", false);

  assert(fx.creator.CreateStatus("unverified", kNamespace).outcome == CreateStatusOutcome::kUnverified);
  assert(fx.creator.CreateStatus("missing", kNamespace).outcome == CreateStatusOutcome::kFileNotFound);
  assert(!fx.store->Exists("unverified", kNamespace));

  SeedBox(*fx.repo, "plain", kLocalFsClass, fx.dir.Path().string());
  SeedUnverifiedReplica(*fx.repo, "replica-unverified", "plain", "r.bin");
  assert(fx.creator.CreateStatus("replica-unverified", kNamespace).outcome == CreateStatusOutcome::kUnverified);
  assert(!fx.store->Exists("replica-unverified", kNamespace));
  assert(!fx.cache->Get(hsm::lock::AdvisoryLock::KeyFor("replica-unverified")).has_value());
}

void TestErrorsPropagateAndReleaseLock() {
  Fixture fx("creator_errors");
  SeedFile(*fx.repo, "s3", "cloud", "s3.bin");
  SeedFile(*fx.repo, "gone", kHsmBox, "gone.bin");

  bool threw = false;
  try {
    fx.creator.CreateStatus("s3", kNamespace);
  } catch (const hsm::util::StorageClassNotSupportedError&) {
    threw = true;
  }
  assert(threw);
  assert(!fx.cache->Get(hsm::lock::AdvisoryLock::KeyFor("s3")).has_value());

  threw = false;
  try {
    fx.creator.CreateStatus("gone", kNamespace);
  } catch (const hsm::util::ProbeError&) {
    threw = true;
  }
  assert(threw);
  assert(!fx.store->Exists("gone", kNamespace));

  threw = false;
  try {
    fx.creator.CreateStatus("s3", "http://unregistered");
  } catch (const hsm::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBackfillCountsOutcomes() {
  Fixture fx("creator_backfill");
  WriteDenseFile(fx.dir.File("a.bin"), kLargeFileSize);
  WriteSparseFile(fx.dir.File("b.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "a", kHsmBox, "a.bin");
  SeedFile(*fx.repo, "b", kHsmBox, "b.bin");
  SeedFile(*fx.repo, "existing", kHsmBox, "a.bin");
  SeedFile(*fx.repo, "unverified", kHsmBox, "u.bin", false);
  SeedFile(*fx.repo, "s3", "cloud", "s3.bin");
  fx.store->Create("existing", kNamespace, true);

  auto report = fx.creator.Backfill(kNamespace);
  assert(report.created == 2);
  assert(report.already_exists == 1);
  assert(report.lock_not_acquired == 0);
  assert(report.failed == 1);
  assert(!fx.store->Exists("unverified", kNamespace));

  auto second = fx.creator.Backfill(kNamespace);
  assert(second.created == 0);
  assert(second.already_exists == 3);
}

} // namespace

int main() {
  TestCreatesOnlineAndOfflineRecords();
  TestRepeatedCallsLeaveOneRecord();
  TestConcurrentCreationWritesOnce();
  TestBusyLockSkipsCreation();
  TestIneligibleFiles();
  TestErrorsPropagateAndReleaseLock();
  TestBackfillCountsOutcomes();

  std::cout << "hsm_status_unit_status_creator: pass\n";
  return 0;
}
