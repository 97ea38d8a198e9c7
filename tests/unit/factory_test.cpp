#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "test_support.hpp"

namespace {

using hsm::test::kNamespace;

template <typename E, typename F>
bool Throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestBuildRegistersDatafileNamespace() {
  auto repo = std::make_shared<hsm::db::memory::MemoryRepository>();
  auto app  = hsm::factory::Build(hsm::config::DefaultConfig(), repo);

  assert(app.datafile_namespace == kNamespace);
  assert(app.status_service != nullptr);
  assert(app.online->StorageClasses().size() == 2);

  auto tx     = repo->Begin();
  auto schema = repo->GetSchema(*tx, kNamespace);
  tx->Commit();
  assert(schema.has_value());
  assert(schema->name == "Datafile HSM Schema");

  // building again over the same catalogue is harmless
  (void)hsm::factory::Build(hsm::config::DefaultConfig(), repo);
}

void TestInvalidConfigIsRejected() {
  auto config = hsm::config::DefaultConfig();
  config.mutable_locks()->set_cache("redis");
  assert(Throws<std::invalid_argument>([&] { (void)hsm::factory::Build(config); }));

  config.mutable_locks()->set_cache("database");
  assert(Throws<std::invalid_argument>([&] { (void)hsm::factory::Build(config); }));

  config = hsm::config::DefaultConfig();
  config.mutable_hsm()->set_probe_strategy("guess");
  assert(Throws<std::invalid_argument>([&] { (void)hsm::factory::Build(config); }));

  config = hsm::config::DefaultConfig();
  config.mutable_hsm()->add_backends()->set_checker("tape");
  assert(Throws<std::invalid_argument>([&] { (void)hsm::factory::Build(config); }));
}

#if HSM_DB_SQLITE
void TestSqliteBuildPersistsAcrossRestarts() {
  hsm::test::TempDir dir("factory_sqlite");
  auto               config = hsm::config::DefaultConfig();
  config.mutable_database()->mutable_sqlite()->set_path(dir.File("status.db"));
  config.mutable_locks()->set_cache("database");

  {
    auto app = hsm::factory::Build(config);
    hsm::test::SeedBox(*app.repository, "box", hsm::test::kLocalFsClass, dir.Path().string());
    hsm::test::WriteDenseFile(dir.File("f.bin"), hsm::test::kLargeFileSize);
    hsm::test::SeedFile(*app.repository, "f1", "box", "f.bin");
    assert(app.creator->CreateStatus("f1", app.datafile_namespace).Created());
  }

  auto app = hsm::factory::Build(config);
  assert(app.store->Get("f1", app.datafile_namespace) == true);
}
#endif

} // namespace

int main() {
  TestBuildRegistersDatafileNamespace();
  TestInvalidConfigIsRejected();
#if HSM_DB_SQLITE
  TestSqliteBuildPersistsAcrossRestarts();
#endif

  std::cout << "hsm_status_unit_factory: pass\n";
  return 0;
}
