#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace hsm::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertFile(Transaction&, const model::TrackedFileRecord&) override;
  Result UpdateFile(Transaction&, const model::TrackedFileRecord&) override;
  std::optional<model::TrackedFileRecord> GetFile(Transaction&, const std::string&) override;
  std::vector<model::TrackedFileRecord> ListFiles(Transaction&) override;
  std::vector<model::TrackedFileRecord> ListFilesInDataset(Transaction&, const std::string&) override;

  Result InsertStorageBox(Transaction&, const model::StorageBoxRecord&) override;
  std::optional<model::StorageBoxRecord> GetStorageBox(Transaction&, const std::string&) override;

  Result InsertStorageObject(Transaction&, const model::StorageObjectRecord&) override;
  std::vector<model::StorageObjectRecord> ListStorageObjects(Transaction&, const std::string&) override;

  Result InsertDataset(Transaction&, const model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string&) override;
  std::vector<model::DatasetRecord> ListDatasetsInExperiment(Transaction&, const std::string&) override;

  Result InsertSchema(Transaction&, const model::SchemaRecord&) override;
  std::optional<model::SchemaRecord> GetSchema(Transaction&, const std::string&) override;

  Result InsertStatus(Transaction&, const model::StatusRecord&) override;
  std::optional<model::StatusRecord> GetStatus(Transaction&, const std::string&, const std::string&) override;
  Result UpdateStatus(Transaction&, const model::StatusRecord&) override;
  std::vector<model::StatusRecord> ListStatusByValue(Transaction&, const std::string& namespace_uri, const std::string& value,
                                                     const std::string& after_file_id, std::size_t limit) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3*, int rc);

  std::vector<std::string> ExperimentsOf(sqlite3* db, const std::string& dataset_id);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace hsm::db::sqlite
