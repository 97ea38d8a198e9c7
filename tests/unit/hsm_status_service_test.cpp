#include "internal/service/hsm_status_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace hsm::status::v1;
using namespace hsm::test;

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    auto config = hsm::config::DefaultConfig();
    config.mutable_hsm()->set_probe_strategy("native");
    config.mutable_hsm()->set_worker_threads(2);
    auto* backend = config.mutable_hsm()->add_backends();
    backend->set_storage_box(kHsmBox);
    backend->set_checker("filesystem");
    backend->set_retriever("filesystem");

    app = hsm::factory::Build(config, repo);

    SeedBox(*repo, kHsmBox, kLocalFsClass, dir.Path().string());
    SeedBox(*repo, "cloud", kS3Class, "bucket");
  }

  hsm::service::HsmStatusService& Service() {
    return *app.status_service;
  }

  TempDir                                             dir;
  std::shared_ptr<hsm::db::memory::MemoryRepository> repo = std::make_shared<hsm::db::memory::MemoryRepository>();
  hsm::factory::Application                          app;
};

template <typename E, typename F>
bool Throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestVerifiedFileGetsStatusAndSweepFlipsIt() {
  Fixture fx("service_lifecycle");
  WriteDenseFile(fx.dir.File("f.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "f1", kHsmBox, "f.bin", true, "ds1");
  SeedDataset(*fx.repo, "ds1", {"exp1"});

  auto created = fx.Service().OnFileVerified("f1");
  assert(created.outcome() == CREATE_STATUS_OUTCOME_CREATED);
  assert(created.online());

  GetFileStatusRequest file_req;
  file_req.set_file_id("f1");
  assert(fx.Service().GetFileStatus(file_req).online());

  GetDatasetStatusRequest dataset_req;
  dataset_req.set_dataset_id("ds1");
  assert(fx.Service().GetDatasetStatus(dataset_req).online());

  // content migrated to tape
  WriteSparseFile(fx.dir.File("f.bin"), kLargeFileSize);

  CheckOnlineRequest check_req;
  check_req.set_file_id("f1");
  assert(!fx.Service().CheckOnline(check_req).online());
  // a live check does not persist anything
  assert(fx.Service().GetFileStatus(file_req).online());

  auto sweep = fx.Service().RunSweep(RunSweepRequest{});
  assert(sweep.report().candidates() == 1);
  assert(sweep.report().flipped_offline() == 1);

  assert(!fx.Service().GetFileStatus(file_req).online());
  assert(!fx.Service().GetDatasetStatus(dataset_req).online());

  GetExperimentStatusRequest experiment_req;
  experiment_req.set_experiment_id("exp1");
  assert(!fx.Service().GetExperimentStatus(experiment_req).online());

  CreateStatusRequest create_req;
  create_req.set_file_id("f1");
  assert(fx.Service().CreateStatus(create_req).outcome() == CREATE_STATUS_OUTCOME_ALREADY_EXISTS);
}

void TestBackfillAndRetrieve() {
  Fixture fx("service_backfill");
  WriteDenseFile(fx.dir.File("a.bin"), kLargeFileSize);
  WriteSparseFile(fx.dir.File("b.bin"), kLargeFileSize);
  SeedFile(*fx.repo, "a", kHsmBox, "a.bin");
  SeedFile(*fx.repo, "b", kHsmBox, "b.bin");

  auto backfill = fx.Service().Backfill(BackfillRequest{});
  assert(backfill.created() == 2);
  assert(backfill.failed() == 0);

  GetFileStatusRequest b_req;
  b_req.set_file_id("b");
  assert(!fx.Service().GetFileStatus(b_req).online());

  RetrieveRequest retrieve_req;
  retrieve_req.add_file_ids("b");
  retrieve_req.add_file_ids("missing");
  auto retrieved = fx.Service().Retrieve(retrieve_req);
  assert(retrieved.results_size() == 2);
  assert(retrieved.results(0).file_id() == "b" && retrieved.results(0).ok());
  assert(retrieved.results(0).error().empty());
  assert(retrieved.results(1).file_id() == "missing" && !retrieved.results(1).ok());
  assert(!retrieved.results(1).error().empty());
}

void TestRequestValidationAndErrors() {
  Fixture fx("service_errors");
  SeedFile(*fx.repo, "s3", "cloud", "s3.bin");

  assert(Throws<std::invalid_argument>([&] { fx.Service().CheckOnline(CheckOnlineRequest{}); }));
  assert(Throws<std::invalid_argument>([&] { fx.Service().CreateStatus(CreateStatusRequest{}); }));
  assert(Throws<std::invalid_argument>([&] { fx.Service().GetDatasetStatus(GetDatasetStatusRequest{}); }));

  CheckOnlineRequest s3_req;
  s3_req.set_file_id("s3");
  assert(Throws<hsm::util::StorageClassNotSupportedError>([&] { fx.Service().CheckOnline(s3_req); }));

  GetFileStatusRequest no_record;
  no_record.set_file_id("s3");
  assert(Throws<hsm::util::NotFound>([&] { fx.Service().GetFileStatus(no_record); }));

  RunSweepRequest other_namespace;
  other_namespace.set_namespace_uri("http://unregistered");
  assert(Throws<hsm::util::NotFound>([&] { fx.Service().RunSweep(other_namespace); }));
}

} // namespace

int main() {
  TestVerifiedFileGetsStatusAndSweepFlipsIt();
  TestBackfillAndRetrieve();
  TestRequestValidationAndErrors();

  std::cout << "hsm_status_unit_hsm_status_service: pass\n";
  return 0;
}
