#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/backend/null_hsm.hpp"
#include "internal/backend/pool_hsm.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using hsm::backend::NullHsm;
using hsm::backend::PoolHsm;
using hsm::backend::RetrieveEntry;
using hsm::backend::StorageObject;
using hsm::util::Outcome;

std::shared_ptr<PoolHsm> MakePoolHsm() {
  hsm::probe::StatProbeOptions options;
  options.strategy = hsm::probe::ProbeStrategy::kNative;
  return std::make_shared<PoolHsm>(std::make_shared<hsm::worker::WorkerPool>(2), hsm::probe::StatProbe(options), hsm::test::kMinFileSize);
}

StorageObject Object(const std::string& file_id, const std::string& path, bool verified = true) {
  StorageObject object;
  object.file_id  = file_id;
  object.path     = path;
  object.verified = verified;
  return object;
}

Outcome<bool> CheckOnline(hsm::backend::HsmChecker& checker, const StorageObject& object) {
  auto promise = std::make_shared<std::promise<Outcome<bool>>>();
  auto future  = promise->get_future();
  checker.Online(object, [promise](Outcome<bool> outcome) { promise->set_value(std::move(outcome)); });
  return future.get();
}

std::vector<RetrieveEntry> RetrieveAll(hsm::backend::HsmRetriever& retriever, const std::vector<StorageObject>& objects) {
  auto promise = std::make_shared<std::promise<std::vector<RetrieveEntry>>>();
  auto future  = promise->get_future();
  retriever.RetrieveBatch(objects, [promise](std::vector<RetrieveEntry> entries) { promise->set_value(std::move(entries)); });
  return future.get();
}

void TestNullHsmReportsEverythingOnline() {
  NullHsm null_hsm;
  assert(CheckOnline(null_hsm, Object("1", "/does/not/matter")).GetOrThrow());

  auto entries = RetrieveAll(null_hsm, {Object("1", "/a"), Object("2", "/b")});
  assert(entries.size() == 2);
  assert(entries[0].file_id == "1" && entries[0].outcome.GetOrThrow());
  assert(entries[1].file_id == "2" && entries[1].outcome.GetOrThrow());
}

void TestPoolHsmClassifiesFiles() {
  hsm::test::TempDir dir("pool_hsm");
  hsm::test::WriteDenseFile(dir.File("online.bin"), hsm::test::kLargeFileSize);
  hsm::test::WriteSparseFile(dir.File("offline.bin"), hsm::test::kLargeFileSize);
  hsm::test::WriteSparseFile(dir.File("small.bin"), 100);

  auto pool_hsm = MakePoolHsm();
  assert(CheckOnline(*pool_hsm, Object("1", dir.File("online.bin"))).GetOrThrow());
  assert(!CheckOnline(*pool_hsm, Object("2", dir.File("offline.bin"))).GetOrThrow());
  assert(CheckOnline(*pool_hsm, Object("3", dir.File("small.bin"))).GetOrThrow());

  // per-object threshold overrides the backend default
  auto large_threshold                = Object("2", dir.File("offline.bin"));
  large_threshold.min_file_size_bytes = 4096;
  assert(CheckOnline(*pool_hsm, large_threshold).GetOrThrow());
}

void TestPoolHsmRejectsUnverifiedSynchronously() {
  auto pool_hsm       = MakePoolHsm();
  bool threw          = false;
  bool callback_fired = false;
  try {
    pool_hsm->Online(Object("1", "/tmp/unverified", false), [&](Outcome<bool>) { callback_fired = true; });
  } catch (const hsm::util::Unverified&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    pool_hsm->Retrieve(Object("1", "/tmp/unverified", false), [&](Outcome<bool>) { callback_fired = true; });
  } catch (const hsm::util::Unverified&) {
    threw = true;
  }
  assert(threw);
  assert(!callback_fired);
}

void TestPoolHsmProbeFailureIsDelivered() {
  auto outcome = CheckOnline(*MakePoolHsm(), Object("1", "/nonexistent/hsm/status/file"));
  assert(outcome.FailedWith<hsm::util::ProbeError>());
}

void TestPoolHsmBatchRetrieveKeepsInputOrder() {
  hsm::test::TempDir dir("pool_hsm_retrieve");
  hsm::test::WriteDenseFile(dir.File("a.bin"), 10);
  hsm::test::WriteDenseFile(dir.File("b.bin"), 10);

  auto entries = RetrieveAll(*MakePoolHsm(), {Object("a", dir.File("a.bin")), Object("missing", dir.File("missing.bin")),
                                              Object("u", dir.File("b.bin"), false), Object("b", dir.File("b.bin"))});
  assert(entries.size() == 4);
  assert(entries[0].file_id == "a" && entries[0].outcome.GetOrThrow());
  assert(entries[1].file_id == "missing" && entries[1].outcome.FailedWith<hsm::util::RetrieveError>());
  assert(entries[2].file_id == "u" && entries[2].outcome.FailedWith<hsm::util::Unverified>());
  assert(entries[3].file_id == "b" && entries[3].outcome.GetOrThrow());

  assert(RetrieveAll(*MakePoolHsm(), {}).empty());
}

} // namespace

int main() {
  TestNullHsmReportsEverythingOnline();
  TestPoolHsmClassifiesFiles();
  TestPoolHsmRejectsUnverifiedSynchronously();
  TestPoolHsmProbeFailureIsDelivered();
  TestPoolHsmBatchRetrieveKeepsInputOrder();

  std::cout << "hsm_status_unit_hsm_backend: pass\n";
  return 0;
}
