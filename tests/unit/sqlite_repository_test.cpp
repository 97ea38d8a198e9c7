#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "repository_contract.hpp"

namespace {

using hsm::db::sqlite::SqliteDB;
using hsm::db::sqlite::SqliteRepository;

std::shared_ptr<SqliteRepository> Open(const std::string& path) {
  auto db = std::make_shared<SqliteDB>(path);
  hsm::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<SqliteRepository>(db);
}

template <typename Check>
void OnFreshRepository(const std::string& name, Check check) {
  hsm::test::TempDir dir("sqlite_repository_" + name);
  auto               repo = Open(dir.File("status.db"));
  check(*repo);
}

void TestRecordsSurviveReopen() {
  hsm::test::TempDir dir("sqlite_repository_reopen");
  const auto         path = dir.File("status.db");
  {
    auto repo = Open(path);
    hsm::test::SeedNamespace(*repo);
    hsm::test::SeedBox(*repo, "box", hsm::test::kLocalFsClass, "/data");
    hsm::test::SeedFile(*repo, "f1", "box", "a.bin");

    auto tx = repo->Begin();
    assert(repo->InsertStatus(*tx, {hsm::test::kNamespace, "f1", "True", 42}));
    tx->Commit();
  }

  // bootstrap is idempotent on an existing file
  auto repo   = Open(path);
  auto tx     = repo->Begin();
  auto record = repo->GetStatus(*tx, hsm::test::kNamespace, "f1");
  auto file   = repo->GetFile(*tx, "f1");
  tx->Commit();

  assert(record.has_value());
  assert(record->value == "True");
  assert(record->updated_at_ms == 42);
  assert(file.has_value() && file->verified);
}

void TestStatusValueIsConstrained() {
  hsm::test::TempDir dir("sqlite_repository_check");
  auto               repo = Open(dir.File("status.db"));
  hsm::test::SeedNamespace(*repo);

  auto tx = repo->Begin();
  assert(repo->InsertStatus(*tx, {hsm::test::kNamespace, "f1", "Maybe", 1}).code == hsm::db::ErrorCode::ConstraintViolation);
  tx->Commit();
}

void TestConcurrentWritersShareConnection() {
  hsm::test::TempDir dir("sqlite_repository_threads");
  auto               repo = Open(dir.File("status.db"));
  hsm::test::SeedNamespace(*repo);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&repo, i] {
      for (int j = 0; j < 10; ++j) {
        auto tx = repo->Begin();
        auto r  = repo->InsertStatus(*tx, {hsm::test::kNamespace, "f" + std::to_string(i * 100 + j), "True", 1});
        assert(r);
        (void)r;
        tx->Commit();
      }
    });
  }
  for (auto& t : threads) t.join();

  auto tx = repo->Begin();
  assert(repo->ListStatusByValue(*tx, hsm::test::kNamespace, "True", "", 100).size() == 40);
  tx->Commit();
}

} // namespace

int main() {
  OnFreshRepository("catalogue", hsm::test::VerifyFileCatalogue);
  OnFreshRepository("objects", hsm::test::VerifyStorageObjects);
  OnFreshRepository("datasets", hsm::test::VerifyDatasets);
  OnFreshRepository("status", hsm::test::VerifyStatusRecords);
  OnFreshRepository("paging", hsm::test::VerifyStatusKeysetPaging);
  OnFreshRepository("rollback", hsm::test::VerifyRollbackDiscardsWrites);
  TestRecordsSurviveReopen();
  TestStatusValueIsConstrained();
  TestConcurrentWritersShareConnection();

  std::cout << "hsm_status_unit_sqlite_repository: pass\n";
  return 0;
}
